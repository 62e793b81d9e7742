#pragma once

namespace fits {
class HDU;
}  // namespace fits

namespace fitsmeta {

// Concrete variant of an HDU.
enum class HduKind {
    primary,
    image_extension,
    binary_table,
    ascii_table,
    compressed_image,
    random_groups,
};

// Display name written to the report, e.g. "PrimaryHDU".
const char* kind_name(HduKind kind);

// Determines the variant of an HDU from its position, extension type and keywords.
HduKind hdu_kind(fits::HDU& hdu);
}  // namespace fitsmeta
