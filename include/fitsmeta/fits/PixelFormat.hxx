#pragma once

// Third-party headers
#include <fitsio.h>

// Standard library
#include <string>

namespace fits {

// Bit formats for FITS Images.
enum class PixelFormat {
    unknown = 0,
    byte_8bit = BYTE_IMG,
    int_16bit = SHORT_IMG,
    int_32bit = LONG_IMG,
    int_64bit = LONGLONG_IMG,
    float_32bit = FLOAT_IMG,
    double_64bit = DOUBLE_IMG,
    sbyte_8bit = SBYTE_IMG,
    uint_16bit = USHORT_IMG,
    uint_32bit = ULONG_IMG,
    uint_64bit = ULONGLONG_IMG,
};

// Codes for FITS Table data types.
enum class TableDataType {
    unknown = 0,
    bit_t = TBIT,
    byte_t = TBYTE,
    sbyte_t = TSBYTE,
    logical_t = TLOGICAL,
    string_t = TSTRING,
    ushort_t = TUSHORT,
    short_t = TSHORT,
    uint_t = TUINT,
    int_t = TINT,
    ulong_t = TULONG,
    long_t = TLONG,
    int32_t = TINT32BIT,
    float_t = TFLOAT,
    ulonglong_t = TULONGLONG,
    longlong_t = TLONGLONG,
    double_t = TDOUBLE,
    complex_t = TCOMPLEX,
    complex_double_t = TDBLCOMPLEX,
};

// Gets the element type name of a pixel format, e.g. "float32" for FLOAT_IMG.
// Returns an empty string for `PixelFormat::unknown`.
std::string pixel_type_name(PixelFormat pixel_format);

// Gets the element type name of a table column type, e.g. "int32" for TLONG. Character
// columns are "S"; their width is not part of the type. Returns an empty string for
// unknown codes.
std::string table_type_name(TableDataType data_type);
}  // namespace fits
