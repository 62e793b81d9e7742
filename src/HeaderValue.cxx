#include "fitsmeta/HeaderValue.hxx"

// Local headers
#include "fitsmeta/fits/Keyword.hxx"

// Standard library
#include <algorithm>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <stdexcept>

namespace fitsmeta {
namespace {
const char* const blanks = " \t";

std::string trim(const std::string& str) {
    size_t first = str.find_first_not_of(blanks);
    if (first == std::string::npos) return std::string();
    size_t last = str.find_last_not_of(blanks);
    return str.substr(first, last - first + 1);
}

std::string trim_right(const std::string& str) {
    size_t last = str.find_last_not_of(blanks);
    return last == std::string::npos ? std::string() : str.substr(0, last + 1);
}

HeaderValue parse_integer(const std::string& text) {
    errno = 0;
    char* end = nullptr;
    long long value = std::strtoll(text.c_str(), &end, 10);
    if (end == text.c_str() || *end != '\0') return HeaderValue::from_other(text);
    if (errno != ERANGE) return HeaderValue::from_integer(value);

    // Positive values up to UINT64_MAX.
    if (text[0] == '-') return HeaderValue::from_other(text);
    errno = 0;
    unsigned long long unsigned_value = std::strtoull(text.c_str(), &end, 10);
    if (errno == ERANGE || *end != '\0') return HeaderValue::from_other(text);
    return HeaderValue::from_unsigned(unsigned_value);
}

HeaderValue parse_float(const std::string& text) {
    // Fortran-style exponents, e.g. 1.5D+03.
    std::string normalized = text;
    std::replace(normalized.begin(), normalized.end(), 'D', 'E');
    std::replace(normalized.begin(), normalized.end(), 'd', 'e');

    // strtod also takes hexadecimal floats, which are not FITS syntax.
    if (normalized.find_first_of("xX") != std::string::npos) {
        return HeaderValue::from_other(text);
    }

    errno = 0;
    char* end = nullptr;
    double value = std::strtod(normalized.c_str(), &end);
    if (errno == ERANGE || end == normalized.c_str() || *end != '\0' ||
        !std::isfinite(value)) {
        return HeaderValue::from_other(text);
    }
    return HeaderValue::from_float(value);
}
}  // namespace

HeaderValue::HeaderValue() : HeaderValue(Kind::null) {}
HeaderValue::HeaderValue(Kind kind) : kind_(kind) {}

HeaderValue HeaderValue::from_string(const std::string& value) {
    HeaderValue result(Kind::string);
    result.text_ = value;
    return result;
}
HeaderValue HeaderValue::from_integer(long long value) {
    HeaderValue result(Kind::integer);
    result.integer_ = value;
    return result;
}
HeaderValue HeaderValue::from_unsigned(unsigned long long value) {
    HeaderValue result(Kind::unsigned_integer);
    result.unsigned_ = value;
    return result;
}
HeaderValue HeaderValue::from_float(double value) {
    HeaderValue result(Kind::floating);
    result.floating_ = value;
    return result;
}
HeaderValue HeaderValue::from_bool(bool value) {
    HeaderValue result(Kind::boolean);
    result.boolean_ = value;
    return result;
}
HeaderValue HeaderValue::from_other(const std::string& text) {
    HeaderValue result(Kind::other);
    result.text_ = text;
    return result;
}

const std::string& HeaderValue::as_string() const {
    if (kind_ != Kind::string && kind_ != Kind::other) {
        throw std::logic_error("header value is not a string");
    }
    return text_;
}
long long HeaderValue::as_integer() const {
    if (kind_ != Kind::integer) throw std::logic_error("header value is not an integer");
    return integer_;
}
unsigned long long HeaderValue::as_unsigned() const {
    if (kind_ != Kind::unsigned_integer) {
        throw std::logic_error("header value is not an unsigned integer");
    }
    return unsigned_;
}
double HeaderValue::as_float() const {
    if (kind_ != Kind::floating) throw std::logic_error("header value is not a float");
    return floating_;
}
bool HeaderValue::as_bool() const {
    if (kind_ != Kind::boolean) throw std::logic_error("header value is not a boolean");
    return boolean_;
}

bool HeaderValue::operator==(const HeaderValue& right) const {
    if (kind_ != right.kind_) return false;
    switch (kind_) {
        case Kind::null:
            return true;
        case Kind::string:
        case Kind::other:
            return text_ == right.text_;
        case Kind::integer:
            return integer_ == right.integer_;
        case Kind::unsigned_integer:
            return unsigned_ == right.unsigned_;
        case Kind::floating:
            return floating_ == right.floating_;
        case Kind::boolean:
            return boolean_ == right.boolean_;
    }
    return false;
}

HeaderValue parse_keyword_value(const fits::Keyword& keyword) {
    if (!keyword.has_value) return HeaderValue::from_string(trim_right(keyword.comment));

    std::string text = trim(keyword.value);
    switch (keyword.value_type()) {
        case fits::KeywordType::none:
            return HeaderValue();
        case fits::KeywordType::string:
            return HeaderValue::from_string(unquote_string(text));
        case fits::KeywordType::logical:
            if (text == "T") return HeaderValue::from_bool(true);
            if (text == "F") return HeaderValue::from_bool(false);
            return HeaderValue::from_other(text);
        case fits::KeywordType::integer:
            return parse_integer(text);
        case fits::KeywordType::floating:
            return parse_float(text);
        case fits::KeywordType::complex:
            return HeaderValue::from_other(text);
    }
    return HeaderValue::from_other(text);
}

std::string unquote_string(const std::string& literal) {
    size_t start = literal.find_first_not_of(blanks);
    if (start == std::string::npos) return std::string();
    if (literal[start] != '\'') return trim_right(literal.substr(start));

    std::string result;
    for (size_t i = start + 1; i < literal.size(); i++) {
        if (literal[i] == '\'') {
            if (i + 1 < literal.size() && literal[i + 1] == '\'') {
                result += '\'';
                i++;
            } else {
                break;
            }
        } else {
            result += literal[i];
        }
    }
    return trim_right(result);
}
}  // namespace fitsmeta
