#include "fitsmeta/fits/HDUIterator.hxx"

namespace fits {
HDUIterator::HDUIterator(const FitsFile& fits, size_t hdu_index)
        : fits_(fits), hdu_index_(hdu_index) {}

bool HDUIterator::operator==(const HDUIterator& right) const {
    return fits_ == right.fits_ && hdu_index_ == right.hdu_index_;
}

HDUIterator::reference HDUIterator::operator*() { return fits_.make_hdu_current(hdu_index_); }

HDUIterator& HDUIterator::operator++() {
    hdu_index_++;
    return *this;
}
}  // namespace fits
