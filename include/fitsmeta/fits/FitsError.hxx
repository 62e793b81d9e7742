#pragma once

// Local headers
#include "FitsException.hxx"

// Standard library
#include <string>

namespace fits {

// A `FitsException` carrying the status code of a failed cfitsio call.
class FitsError : public FitsException {
public:
    explicit FitsError(int status);

    // Prefix the cfitsio message with what the caller was attempting, e.g. the file name.
    FitsError(const std::string& context, int status);

    int status() const;

    // Gets the short description of `status` followed by every message left on the
    // cfitsio error stack, one per line. Reading the stack also clears it.
    static std::string get_error_message(int status);

private:
    int status_;
};

// Throw a `FitsError` if `status` reports a cfitsio failure.
void check_status(int status);
void check_status(int status, const std::string& context);
}  // namespace fits
