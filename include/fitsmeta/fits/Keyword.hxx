#pragma once

// External APIs
#include <fitsio.h>

// Standard library
#include <string>

namespace fits {

// Classification of a keyword value, as reported by `fits_get_keytype`.
enum class KeywordType {
    none,  // commentary card or undefined value
    string,
    logical,
    integer,
    floating,
    complex,
};

// One header record, split into its name, raw value text and comment.
struct Keyword {
    std::string name;
    std::string value;
    std::string comment;

    // False for commentary cards (COMMENT, HISTORY, blank, ...) that have no "= " in
    // columns 9-10. Their text is then held in `comment`.
    bool has_value = false;

    Keyword();

    Keyword(const std::string& name, const std::string& value,
            const std::string& comment = std::string());

    // Parse an 80-character header card.
    explicit Keyword(const std::string& card);

    KeywordType value_type() const;

    // Builds the 80-character card for this keyword.
    std::string card() const;

    bool operator==(const Keyword& right) const;
    bool operator!=(const Keyword& right) const;
};
}  // namespace fits
