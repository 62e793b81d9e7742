#include "fitsmeta/HduKind.hxx"

// Local headers
#include "fitsmeta/fits/FitsException.hxx"
#include "fitsmeta/fits/HDU.hxx"

// Standard library
#include <string>

namespace fitsmeta {
const char* kind_name(HduKind kind) {
    switch (kind) {
        case HduKind::primary:
            return "PrimaryHDU";
        case HduKind::image_extension:
            return "ImageHDU";
        case HduKind::binary_table:
            return "BinTableHDU";
        case HduKind::ascii_table:
            return "TableHDU";
        case HduKind::compressed_image:
            return "CompImageHDU";
        case HduKind::random_groups:
            return "GroupsHDU";
    }
    return "UnknownHDU";
}

HduKind hdu_kind(fits::HDU& hdu) {
    if (hdu.is_random_groups()) return HduKind::random_groups;

    // cfitsio presents tile-compressed images as images.
    if (hdu.hdu_num() > 1 && hdu.is_compressed_image()) return HduKind::compressed_image;

    switch (hdu.ext_type()) {
        case fits::HDU::Type::image:
            return hdu.hdu_num() == 1 ? HduKind::primary : HduKind::image_extension;
        case fits::HDU::Type::binary:
            return HduKind::binary_table;
        case fits::HDU::Type::ascii:
            return HduKind::ascii_table;
        default:
            throw fits::FitsException("HDU " + std::to_string(hdu.hdu_num()) +
                                      " has an unsupported extension type");
    }
}
}  // namespace fitsmeta
