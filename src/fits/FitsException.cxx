#include "fitsmeta/fits/FitsException.hxx"

namespace fits {
FitsException::FitsException(const std::string& message) : std::runtime_error(message) {}
}  // namespace fits
