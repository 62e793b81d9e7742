#include "fitsmeta/fits/HDU.hxx"

// Local headers
#include "fitsmeta/fits/FitsError.hxx"

// Standard library
#include <cstring>

namespace fits {
HDU::HDU(FitsFile& owner, size_t hdu_num) : owner_(owner), hdu_num_(hdu_num) {}

bool HDU::operator==(const HDU& other) const {
    return owner_ == other.owner_ && hdu_num_ == other.hdu_num_;
}
bool HDU::operator!=(const HDU& other) const { return !(*this == other); }

size_t HDU::hdu_num() const { return hdu_num_; }

size_t HDU::naxis() {
    make_current();

    int result = 0;
    int status = 0;
    check_status(fits_get_img_dim(owner_.get(), &result, &status));
    return static_cast<size_t>(result);
}
std::vector<long> HDU::naxes() {
    std::vector<long> result(naxis());
    if (result.empty()) return result;

    int status = 0;
    check_status(fits_get_img_size(owner_.get(), static_cast<int>(result.size()),
                                   result.data(), &status));
    return result;
}

HDU::Type HDU::ext_type() {
    make_current();

    int status = 0;
    int ext_type = 0;
    check_status(fits_get_hdu_type(owner_.get(), &ext_type, &status));
    return static_cast<Type>(ext_type);
}

bool HDU::is_compressed_image() {
    make_current();

    int status = 0;
    return fits_is_compressed_image(owner_.get(), &status) != 0;
}

bool HDU::is_random_groups() {
    if (hdu_num_ != 1) return false;
    if (read_integer("NAXIS", 0) == 0 || read_integer("NAXIS1", -1) != 0) return false;

    int status = 0;
    int groups = 0;
    fits_read_key(owner_.get(), TLOGICAL, "GROUPS", &groups, nullptr, &status);
    if (status == KEY_NO_EXIST) {
        fits_clear_errmsg();
        return false;
    }
    check_status(status);
    return groups != 0;
}

PixelFormat HDU::equivalent_pixel_format() {
    make_current();

    int status = 0;
    int result = 0;
    check_status(fits_get_img_equivtype(owner_.get(), &result, &status));
    return static_cast<PixelFormat>(result);
}

long HDU::row_count() {
    make_current();

    int status = 0;
    long result = 0;
    check_status(fits_get_num_rows(owner_.get(), &result, &status));
    return result;
}
long HDU::row_width() { return static_cast<long>(read_integer("NAXIS1", 0)); }

std::vector<ColumnInfo> HDU::columns() {
    make_current();

    int status = 0;
    int count = 0;
    check_status(fits_get_num_cols(owner_.get(), &count, &status));

    std::vector<ColumnInfo> result(static_cast<size_t>(count));
    for (int i = 0; i < count; i++) {
        ColumnInfo& column = result[static_cast<size_t>(i)];
        int type = 0;
        check_status(fits_get_eqcoltype(owner_.get(), i + 1, &type, &column.repeat,
                                        &column.width, &status));
        // Variable-length arrays are flagged by a negative type code.
        column.variable_length = type < 0;
        column.type = static_cast<TableDataType>(type < 0 ? -type : type);
        column.name = read_string("TTYPE" + std::to_string(i + 1),
                                  "col" + std::to_string(i + 1));
    }
    return result;
}

long long HDU::read_integer(const std::string& key, long long default_value) {
    make_current();

    int status = 0;
    LONGLONG result = 0;
    fits_read_key(owner_.get(), TLONGLONG, key.c_str(), &result, nullptr, &status);
    if (status == KEY_NO_EXIST) {
        fits_clear_errmsg();
        return default_value;
    }
    check_status(status, key);
    return static_cast<long long>(result);
}

std::string HDU::read_string(const std::string& key, const std::string& default_value) {
    make_current();

    int status = 0;
    char result[FLEN_VALUE];
    fits_read_key(owner_.get(), TSTRING, key.c_str(), result, nullptr, &status);
    if (status == KEY_NO_EXIST) {
        fits_clear_errmsg();
        return default_value;
    }
    check_status(status, key);
    return result;
}

void HDU::make_current() { owner_.make_hdu_current(hdu_num_); }

std::vector<std::string> HDU::read_records() {
    make_current();

    int status = 0;
    int count = 0;
    char* header = nullptr;
    check_status(fits_convert_hdr2str(owner_.get(), FALSE, nullptr, 0, &header, &count,
                                      &status));

    std::vector<std::string> result;
    size_t length = std::strlen(header);
    for (size_t offset = 0; offset + FLEN_CARD - 1 <= length; offset += FLEN_CARD - 1) {
        std::string card(header + offset, FLEN_CARD - 1);
        if (card.compare(0, 8, "END     ") == 0) break;
        result.push_back(card);
    }
    fits_free_memory(header, &status);
    check_status(status);
    return result;
}

void HDU::write_record(const std::string& card) {
    make_current();

    int status = 0;
    check_status(fits_write_record(owner_.get(), card.c_str(), &status));
}
void HDU::write_key(const Keyword& keyword) { write_record(keyword.card()); }
void HDU::write_comment(const std::string& text) {
    make_current();

    int status = 0;
    check_status(fits_write_comment(owner_.get(), text.c_str(), &status));
}
void HDU::write_history(const std::string& text) {
    make_current();

    int status = 0;
    check_status(fits_write_history(owner_.get(), text.c_str(), &status));
}
void HDU::write_long_string(const std::string& key, const std::string& value,
                            const std::string& comment) {
    make_current();

    int status = 0;
    check_status(fits_write_key_longwarn(owner_.get(), &status));
    check_status(fits_write_key_longstr(owner_.get(), key.c_str(), value.c_str(),
                                        comment.c_str(), &status),
                 key);
}

void HDU::write_pixels(TableDataType pixel_type, long long first_pixel, long long count,
                       const void* data) {
    make_current();

    int status = 0;
    check_status(fits_write_img(owner_.get(), static_cast<int>(pixel_type), first_pixel,
                                count, const_cast<void*>(data), &status));
}
}  // namespace fits
