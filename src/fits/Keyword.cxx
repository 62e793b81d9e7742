#include "fitsmeta/fits/Keyword.hxx"

// Local headers
#include "fitsmeta/fits/FitsError.hxx"

// Standard library
#include <algorithm>
#include <cstring>

namespace fits {
namespace {
const std::string hierarch_prefix = "HIERARCH ";

// Copy `str` into a NUL-terminated cfitsio buffer, truncating to its capacity.
template <size_t N>
void copy_to(char (&buffer)[N], const std::string& str) {
    size_t n = std::min(str.size(), N - 1);
    std::memcpy(buffer, str.data(), n);
    buffer[n] = '\0';
}

bool is_hierarch(const std::string& card) {
    return card.compare(0, hierarch_prefix.size(), hierarch_prefix) == 0;
}
}  // namespace

Keyword::Keyword() = default;

Keyword::Keyword(const std::string& name, const std::string& value,
                 const std::string& comment)
        : name(name), value(value), comment(comment), has_value(true) {}

Keyword::Keyword(const std::string& card) : Keyword() {
    char buffer[FLEN_CARD];
    copy_to(buffer, card);

    int status = 0;
    int length = 0;
    char key[FLEN_KEYWORD];
    check_status(fits_get_keyname(buffer, key, &length, &status), "invalid keyword");
    name = key;
    if (is_hierarch(name)) name.erase(0, hierarch_prefix.size());

    char val[FLEN_VALUE];
    char com[FLEN_COMMENT];
    check_status(fits_parse_value(buffer, val, com, &status), "invalid keyword value");
    value = val;
    comment = com;

    if (is_hierarch(card)) {
        has_value = card.find('=') != std::string::npos;
    } else {
        has_value = card.size() >= 10 && card[8] == '=' && card[9] == ' ';
    }
}

KeywordType Keyword::value_type() const {
    if (!has_value || value.empty()) return KeywordType::none;

    char buffer[FLEN_VALUE];
    copy_to(buffer, value);

    int status = 0;
    char dtype = '\0';
    check_status(fits_get_keytype(buffer, &dtype, &status), name);
    switch (dtype) {
        case 'C':
            return KeywordType::string;
        case 'L':
            return KeywordType::logical;
        case 'I':
            return KeywordType::integer;
        case 'F':
            return KeywordType::floating;
        case 'X':
            return KeywordType::complex;
        default:
            return KeywordType::none;
    }
}

std::string Keyword::card() const {
    if (!has_value) {
        std::string result = name;
        result.resize(std::max<size_t>(result.size(), 8), ' ');
        result += comment;
        if (result.size() > FLEN_CARD - 1) result.resize(FLEN_CARD - 1);
        return result;
    }

    char val[FLEN_VALUE];
    copy_to(val, value);

    int status = 0;
    char card[FLEN_CARD];
    check_status(fits_make_key(name.c_str(), val, comment.c_str(), card, &status), name);
    return card;
}

bool Keyword::operator==(const Keyword& right) const {
    return name == right.name && value == right.value && comment == right.comment &&
           has_value == right.has_value;
}
bool Keyword::operator!=(const Keyword& right) const { return !(*this == right); }
}  // namespace fits
