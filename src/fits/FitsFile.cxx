#include "fitsmeta/fits/FitsFile.hxx"

// Local headers
#include "fitsmeta/fits/FitsError.hxx"
#include "fitsmeta/fits/HDU.hxx"
#include "fitsmeta/fits/HDUIterator.hxx"

namespace fits {
void FitsFile::deleter::operator()(pointer fptr) {
    int status = 0;
    fits_close_file(fptr, &status);
    if (status > 0) fits_clear_errmsg();
}

FitsFile::FitsFile(fitsfile* fptr) : fptr_(fptr, deleter()) {}

FitsFile::FitsFile(const std::string& path) : FitsFile(open_fits_file(path)) {}

FitsFile FitsFile::create(const std::string& path) {
    fitsfile* result = nullptr;
    int status = 0;

    // A leading '!' tells cfitsio to overwrite an existing file.
    std::string name = "!" + path;
    check_status(fits_create_diskfile(&result, name.c_str(), &status), path);
    return FitsFile(result);
}

bool FitsFile::operator==(const FitsFile& other) const { return fptr_ == other.fptr_; }
bool FitsFile::operator!=(const FitsFile& other) const { return !(*this == other); }

fitsfile* FitsFile::get() { return fptr_.get(); }

size_t FitsFile::hdu_count() {
    int status = 0;
    int result = 0;
    check_status(fits_get_num_hdus(fptr_.get(), &result, &status));
    return static_cast<size_t>(result);
}
size_t FitsFile::current_hdu_num() {
    int result = 0;
    fits_get_hdu_num(fptr_.get(), &result);
    return static_cast<size_t>(result);
}

FitsFile::iterator FitsFile::begin() { return HDUIterator(*this, 1); }
FitsFile::iterator FitsFile::end() { return HDUIterator(*this, hdu_count() + 1); }

HDU FitsFile::make_hdu_current(size_t hdu_num) {
    if (current_hdu_num() != hdu_num) {
        int status = 0;
        int ext_type = 0;
        check_status(fits_movabs_hdu(fptr_.get(), static_cast<int>(hdu_num), &ext_type,
                                     &status));
    }
    return HDU(*this, hdu_num);
}

HDU FitsFile::create_image_hdu(PixelFormat pixel_format, const std::vector<long>& naxes) {
    std::vector<long> axes = naxes;
    int status = 0;
    check_status(fits_create_img(fptr_.get(), static_cast<int>(pixel_format),
                                 static_cast<int>(axes.size()), axes.data(), &status));
    return HDU(*this, current_hdu_num());
}

HDU FitsFile::create_compressed_image_hdu(PixelFormat pixel_format,
                                         const std::vector<long>& naxes) {
    int status = 0;
    check_status(fits_set_compression_type(fptr_.get(), RICE_1, &status));
    return create_image_hdu(pixel_format, naxes);
}

HDU FitsFile::create_groups_hdu(PixelFormat pixel_format, const std::vector<long>& naxes,
                                long long pcount, long long gcount) {
    std::vector<long> axes = naxes;
    int status = 0;
    check_status(fits_write_grphdr(fptr_.get(), TRUE, static_cast<int>(pixel_format),
                                   static_cast<int>(axes.size()), axes.data(), pcount,
                                   gcount, TRUE, &status));
    return HDU(*this, 1);
}

HDU FitsFile::create_table_hdu(bool binary, long rows, const std::vector<ColumnDef>& columns,
                               const std::string& extname) {
    // cfitsio takes non-const string arrays.
    std::vector<std::string> names, formats, units;
    for (const ColumnDef& column : columns) {
        names.push_back(column.name);
        formats.push_back(column.format);
        units.push_back(column.unit);
    }
    std::vector<char*> ttype, tform, tunit;
    for (size_t i = 0; i < columns.size(); i++) {
        ttype.push_back(&names[i][0]);
        tform.push_back(&formats[i][0]);
        tunit.push_back(&units[i][0]);
    }
    std::string name = extname;

    int status = 0;
    check_status(fits_create_tbl(fptr_.get(), binary ? BINARY_TBL : ASCII_TBL, rows,
                                 static_cast<int>(columns.size()), ttype.data(),
                                 tform.data(), tunit.data(),
                                 name.empty() ? nullptr : &name[0], &status));
    return HDU(*this, current_hdu_num());
}

fitsfile* FitsFile::open_fits_file(const std::string& path) {
    fitsfile* result = nullptr;
    int status = 0;
    check_status(fits_open_diskfile(&result, path.c_str(), READONLY, &status), path);
    return result;
}
}  // namespace fits
