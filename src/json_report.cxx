#include "fitsmeta/json_report.hxx"

// Standard library
#include <ostream>

namespace fitsmeta {
json to_json(const HeaderValue& value) {
    switch (value.kind()) {
        case HeaderValue::Kind::null:
            return nullptr;
        case HeaderValue::Kind::string:
        case HeaderValue::Kind::other:
            return value.as_string();
        case HeaderValue::Kind::integer:
            return value.as_integer();
        case HeaderValue::Kind::unsigned_integer:
            return value.as_unsigned();
        case HeaderValue::Kind::floating:
            return value.as_float();
        case HeaderValue::Kind::boolean:
            return value.as_bool();
    }
    return nullptr;
}

json to_json(const Header& header) {
    json result = json::object();
    for (const Header::entry& entry : header) {
        result[entry.first] = to_json(entry.second);
    }
    return result;
}

json to_json(const HduDescriptor& hdu) {
    json result = json::object();
    result["index"] = hdu.index;
    result["type"] = kind_name(hdu.kind);
    result["header"] = to_json(hdu.header);
    if (hdu.has_data()) {
        result["data_shape"] = hdu.data_shape;
        result["data_type"] = hdu.data_type;
    } else {
        result["data_shape"] = nullptr;
        result["data_type"] = nullptr;
    }
    return result;
}

json to_json(const Report& report) {
    if (report.is_error()) {
        json result = json::object();
        result["error"] = report.error();
        return result;
    }

    json result = json::array();
    for (const HduDescriptor& hdu : report.hdus()) {
        result.push_back(to_json(hdu));
    }
    return result;
}

std::string dump_report(const Report& report, int indent) {
    return to_json(report).dump(indent, ' ', true, json::error_handler_t::replace);
}

void write_report(std::ostream& stream, const Report& report, int indent) {
    stream << dump_report(report, indent) << std::endl;
}
}  // namespace fitsmeta
