#include "fitsmeta/normalize.hxx"

// Local headers
#include "fitsmeta/fits/FitsException.hxx"
#include "fitsmeta/fits/FitsFile.hxx"
#include "fitsmeta/fits/HDU.hxx"
#include "fitsmeta/fits/HDUIterator.hxx"
#include "fitsmeta/fits/Keyword.hxx"
#include "fitsmeta/fits/PixelFormat.hxx"
#include "fitsmeta/logging.hxx"

// Standard library
#include <algorithm>
#include <exception>
#include <string>
#include <utility>
#include <vector>

namespace fitsmeta {
namespace {
const std::string continue_keyword = "CONTINUE";
const std::string record_type = "record";

bool ends_with_ampersand(const HeaderValue& value) {
    if (value.kind() != HeaderValue::Kind::string) return false;
    const std::string& text = value.as_string();
    return !text.empty() && text.back() == '&';
}

void describe_image(fits::HDU& hdu, HduDescriptor& result) {
    std::vector<long> naxes = hdu.naxes();
    if (naxes.empty()) return;
    if (std::any_of(naxes.begin(), naxes.end(), [](long n) { return n <= 0; })) return;

    std::string type = fits::pixel_type_name(hdu.equivalent_pixel_format());
    if (type.empty()) {
        throw fits::FitsException("HDU " + std::to_string(hdu.hdu_num()) +
                                  " has an unsupported BITPIX");
    }

    // Slowest-varying axis first.
    result.data_shape.assign(naxes.rbegin(), naxes.rend());
    result.data_type = type;
}

// Column type such as "float32", "S16", "int32[3]" or "vla(float64)".
std::string column_type(const fits::ColumnInfo& column) {
    std::string type = fits::table_type_name(column.type);
    if (type.empty()) {
        throw fits::FitsException("column " + column.name + " has an unsupported type");
    }

    long count = column.repeat;
    if (column.type == fits::TableDataType::string_t) {
        long width = column.width > 0 ? column.width : column.repeat;
        type += std::to_string(width);
        count = width > 0 ? column.repeat / width : 0;
    }
    if (count > 1) type += "[" + std::to_string(count) + "]";
    if (column.variable_length) type = "vla(" + type + ")";
    return type;
}

void describe_table(fits::HDU& hdu, HduDescriptor& result) {
    long rows = hdu.row_count();
    if (rows <= 0 || hdu.row_width() <= 0) return;

    std::string type = record_type + "[";
    std::vector<fits::ColumnInfo> columns = hdu.columns();
    for (size_t i = 0; i < columns.size(); i++) {
        if (i > 0) type += ", ";
        type += columns[i].name + ":" + column_type(columns[i]);
    }
    type += "]";

    result.data_shape.push_back(rows);
    result.data_type = type;
}

void describe_groups(fits::HDU& hdu, HduDescriptor& result) {
    long long groups = hdu.read_integer("GCOUNT", 1);
    if (groups <= 0) return;

    result.data_shape.push_back(groups);
    result.data_type = record_type;
}
}  // namespace

Header read_header(fits::HDU& hdu) {
    Header result;

    // Key of the previous string value if it ends with '&' and may be continued.
    std::string long_key;

    for (const std::string& card : hdu.read_records()) {
        fits::Keyword keyword(card);

        if (keyword.name == continue_keyword && !long_key.empty()) {
            std::string text = result.find(long_key)->as_string();
            text.pop_back();
            text += unquote_string(card.size() > 8 ? card.substr(8) : std::string());
            HeaderValue value = HeaderValue::from_string(text);
            result.set(long_key, value);
            if (!ends_with_ampersand(value)) long_key.clear();
            continue;
        }

        if (keyword.name.empty()) {
            long_key.clear();
            continue;
        }

        HeaderValue value = parse_keyword_value(keyword);
        result.set(keyword.name, value);
        long_key = ends_with_ampersand(value) ? keyword.name : std::string();
    }
    return result;
}

HduDescriptor describe_hdu(fits::HDU& hdu, size_t index) {
    HduDescriptor result;
    result.index = index;
    result.kind = hdu_kind(hdu);
    result.header = read_header(hdu);

    switch (result.kind) {
        case HduKind::primary:
        case HduKind::image_extension:
        case HduKind::compressed_image:
            describe_image(hdu, result);
            break;
        case HduKind::binary_table:
        case HduKind::ascii_table:
            describe_table(hdu, result);
            break;
        case HduKind::random_groups:
            describe_groups(hdu, result);
            break;
    }

    logger()->debug("HDU {}: {} with {} keywords", index, kind_name(result.kind),
                    result.header.size());
    return result;
}

Report normalize(const std::string& filename) {
    try {
        std::vector<HduDescriptor> hdus;
        {
            fits::FitsFile file(filename);
            logger()->debug("opened {} with {} HDUs", filename, file.hdu_count());

            size_t index = 0;
            for (fits::HDU hdu : file) {
                hdus.push_back(describe_hdu(hdu, index++));
            }
        }
        logger()->debug("closed {}", filename);
        return Report::success(std::move(hdus));
    } catch (const std::exception& e) {
        std::string message = e.what();
        if (message.empty()) message = "failed to read FITS file " + filename;
        logger()->warn("{}", message);
        return Report::failure(message);
    }
}
}  // namespace fitsmeta
