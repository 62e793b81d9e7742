#pragma once

// Standard library
#include <stdexcept>
#include <string>

namespace fits {

// Base class for every error raised by the fits layer.
class FitsException : public std::runtime_error {
public:
    explicit FitsException(const std::string& message);
};
}  // namespace fits
