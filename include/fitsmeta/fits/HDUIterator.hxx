#pragma once

// Local headers
#include "FitsFile.hxx"
#include "HDU.hxx"

// Standard library
#include <cstddef>
#include <iterator>

namespace fits {
class HDUIterator {
public:
    using iterator_category = std::input_iterator_tag;
    using value_type = HDU;
    using reference = value_type;
    using difference_type = std::ptrdiff_t;
    using pointer = void;

    HDUIterator(const FitsFile& fits, size_t hdu_index);

    bool operator==(const HDUIterator& right) const;
    bool operator!=(const HDUIterator& right) const { return !(*this == right); }

    reference operator*();

    HDUIterator& operator++();

private:
    FitsFile fits_;
    size_t hdu_index_;
};
}  // namespace fits
