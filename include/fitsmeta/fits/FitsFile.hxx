#pragma once

// Local headers
#include "PixelFormat.hxx"

// External APIs
#include <fitsio.h>

// Standard library
#include <memory>
#include <string>
#include <vector>

namespace fits {
class HDU;
class HDUIterator;

// Describes one column of a table HDU, in cfitsio TFORM notation (e.g. "1J", "20A").
struct ColumnDef {
    std::string name;
    std::string format;
    std::string unit;
};

/// Shared RAII owner of a cfitsio `fitsfile` pointer. Copies refer to the same open file,
/// which is closed when the last copy is destroyed.
class FitsFile {
public:
    struct deleter {
        using element_type = fitsfile;
        using pointer = fitsfile*;

        void operator()(pointer fptr);
    };

    using iterator = HDUIterator;

private:
    explicit FitsFile(fitsfile* fptr);

public:
    // Open a FITS file on disk read-only. `path` is taken literally: cfitsio's extended
    // filename syntax (HDU selectors, filters, URLs, "-" for stdin) is not interpreted.
    explicit FitsFile(const std::string& path);

    // Create a new, empty FITS file at `path`, replacing any existing file. `path` is taken
    // literally as above.
    static FitsFile create(const std::string& path);

    bool operator==(const FitsFile& other) const;
    bool operator!=(const FitsFile& other) const;

    fitsfile* get();

    size_t hdu_count();
    size_t current_hdu_num();

    iterator begin();
    iterator end();

    HDU make_hdu_current(size_t hdu_num);

    // Append an image HDU. `naxes` is in FITS order (NAXIS1 first).
    HDU create_image_hdu(PixelFormat pixel_format, const std::vector<long>& naxes);

    // Append a Rice tile-compressed image HDU. Images created afterwards in this file are
    // compressed too.
    HDU create_compressed_image_hdu(PixelFormat pixel_format, const std::vector<long>& naxes);

    // Write a random groups primary header into a newly created file. `naxes` starts with
    // the NAXIS1 = 0 marker.
    HDU create_groups_hdu(PixelFormat pixel_format, const std::vector<long>& naxes,
                          long long pcount, long long gcount);

    // Append a binary or ASCII table HDU holding `rows` empty rows.
    HDU create_table_hdu(bool binary, long rows, const std::vector<ColumnDef>& columns,
                         const std::string& extname = std::string());

private:
    static fitsfile* open_fits_file(const std::string& path);

    std::shared_ptr<fitsfile> fptr_;
};
}  // namespace fits
