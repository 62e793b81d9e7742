#include "fitsmeta/fits/PixelFormat.hxx"

namespace fits {
std::string pixel_type_name(PixelFormat pixel_format) {
    switch (pixel_format) {
        case PixelFormat::byte_8bit:
            return "uint8";
        case PixelFormat::sbyte_8bit:
            return "int8";
        case PixelFormat::int_16bit:
            return "int16";
        case PixelFormat::uint_16bit:
            return "uint16";
        case PixelFormat::int_32bit:
            return "int32";
        case PixelFormat::uint_32bit:
            return "uint32";
        case PixelFormat::int_64bit:
            return "int64";
        case PixelFormat::uint_64bit:
            return "uint64";
        case PixelFormat::float_32bit:
            return "float32";
        case PixelFormat::double_64bit:
            return "float64";
        default:
            return std::string();
    }
}

std::string table_type_name(TableDataType data_type) {
    switch (data_type) {
        case TableDataType::bit_t:
            return "bit";
        case TableDataType::logical_t:
            return "bool";
        case TableDataType::string_t:
            return "S";
        case TableDataType::byte_t:
            return "uint8";
        case TableDataType::sbyte_t:
            return "int8";
        case TableDataType::short_t:
            return "int16";
        case TableDataType::ushort_t:
            return "uint16";
        case TableDataType::int_t:
        case TableDataType::long_t:
            return "int32";
        case TableDataType::uint_t:
        case TableDataType::ulong_t:
            return "uint32";
        case TableDataType::longlong_t:
            return "int64";
        case TableDataType::ulonglong_t:
            return "uint64";
        case TableDataType::float_t:
            return "float32";
        case TableDataType::double_t:
            return "float64";
        case TableDataType::complex_t:
            return "complex64";
        case TableDataType::complex_double_t:
            return "complex128";
        default:
            return std::string();
    }
}
}  // namespace fits
