#pragma once

// Local headers
#include "FitsFile.hxx"
#include "Keyword.hxx"
#include "PixelFormat.hxx"

// Standard library
#include <cstddef>
#include <string>
#include <vector>

namespace fits {
// Layout of one table column as cfitsio reports it.
struct ColumnInfo {
    std::string name;
    TableDataType type = TableDataType::unknown;
    long repeat = 0;
    // Bytes per element, or characters per string for character columns.
    long width = 0;
    bool variable_length = false;
};

class HDU {
public:
    enum class Type {
        image = IMAGE_HDU,
        ascii = ASCII_TBL,
        binary = BINARY_TBL,
        any = ANY_HDU,
    };

    HDU(FitsFile& owner, size_t hdu_num);

    bool operator==(const HDU& other) const;
    bool operator!=(const HDU& other) const;

    // 1-based position of this HDU in its file.
    size_t hdu_num() const;

    size_t naxis();

    // Axis lengths in FITS order, NAXIS1 first.
    std::vector<long> naxes();

    Type ext_type();

    // True for tile-compressed images stored in a binary table.
    bool is_compressed_image();

    // True for a primary HDU using the random groups convention (NAXIS1 = 0, GROUPS = T).
    bool is_random_groups();

    // The pixel format after applying BSCALE and BZERO.
    PixelFormat equivalent_pixel_format();

    // Number of rows and the width of one row, in bytes, for a table HDU.
    long row_count();
    long row_width();

    // Columns of a table HDU, in order.
    std::vector<ColumnInfo> columns();

    // Reads an integer keyword, returning `default_value` if it does not exist.
    long long read_integer(const std::string& key, long long default_value);
    std::string read_string(const std::string& key, const std::string& default_value);

    void make_current();

    // Every 80-character header card in order, without END. A tile-compressed image yields
    // the header of the image it holds rather than the one of its binary table.
    std::vector<std::string> read_records();

    void write_record(const std::string& card);
    void write_key(const Keyword& keyword);
    void write_comment(const std::string& text);
    void write_history(const std::string& text);
    void write_long_string(const std::string& key, const std::string& value,
                           const std::string& comment = std::string());

    // Write `count` pixels of `pixel_type` starting at the 1-based pixel `first_pixel`.
    void write_pixels(TableDataType pixel_type, long long first_pixel, long long count,
                      const void* data);

private:
    FitsFile owner_;
    size_t hdu_num_;
};
}  // namespace fits
