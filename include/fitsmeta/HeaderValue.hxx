#pragma once

// Standard library
#include <string>

namespace fits {
struct Keyword;
}  // namespace fits

namespace fitsmeta {

/** A JSON-safe header value.
 *
 * Holds one of null, string, integer, floating-point or boolean. Integers above INT64_MAX
 * that still fit 64 bits are kept unsigned. Values that have no JSON counterpart (complex
 * numbers, wider integers, non-finite floats) are kept as their header text under the
 * `other` kind and serialize as strings.
 */
class HeaderValue {
public:
    enum class Kind { null, string, integer, unsigned_integer, floating, boolean, other };

    HeaderValue();

    static HeaderValue from_string(const std::string& value);
    static HeaderValue from_integer(long long value);
    static HeaderValue from_unsigned(unsigned long long value);
    static HeaderValue from_float(double value);
    static HeaderValue from_bool(bool value);
    static HeaderValue from_other(const std::string& text);

    Kind kind() const { return kind_; }
    bool is_null() const { return kind_ == Kind::null; }

    // Text of a `string` or `other` value.
    const std::string& as_string() const;
    long long as_integer() const;
    unsigned long long as_unsigned() const;
    double as_float() const;
    bool as_bool() const;

    bool operator==(const HeaderValue& right) const;
    bool operator!=(const HeaderValue& right) const { return !(*this == right); }

private:
    explicit HeaderValue(Kind kind);

    Kind kind_;
    std::string text_;
    long long integer_ = 0;
    unsigned long long unsigned_ = 0;
    double floating_ = 0.0;
    bool boolean_ = false;
};

/// Converts the value of a parsed header record. Commentary records yield their text.
HeaderValue parse_keyword_value(const fits::Keyword& keyword);

/// Returns the contents of a quoted FITS string literal: the surrounding quotes are
/// removed, doubled quotes unescaped and trailing blanks trimmed. Text after the closing
/// quote is ignored.
std::string unquote_string(const std::string& literal);
}  // namespace fitsmeta
