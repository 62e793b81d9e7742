#include "fitsmeta/fits/FitsError.hxx"

// External APIs
#include <fitsio.h>

// Standard library
#include <sstream>

namespace fits {
FitsError::FitsError(int status) : FitsException(get_error_message(status)), status_(status) {}
FitsError::FitsError(const std::string& context, int status)
        : FitsException(context + ": " + get_error_message(status)), status_(status) {}

int FitsError::status() const { return status_; }

std::string FitsError::get_error_message(int status) {
    std::stringstream ss;

    // Get short error message corresponding to given status.
    char msg[FLEN_STATUS];
    fits_get_errstatus(status, msg);
    ss << msg;

    // Flush error message stack to result string.
    char err[FLEN_ERRMSG];
    while (fits_read_errmsg(err) > 0) ss << std::endl << err;

    return ss.str();
}

void check_status(int status) {
    if (status > 0) throw FitsError(status);
}
void check_status(int status, const std::string& context) {
    if (status > 0) throw FitsError(context, status);
}
}  // namespace fits
