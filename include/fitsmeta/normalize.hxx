#pragma once

// Local headers
#include "Header.hxx"
#include "Report.hxx"

// Standard library
#include <string>

namespace fits {
class HDU;
}  // namespace fits

namespace fitsmeta {

/** Opens `filename` as a FITS file and describes every HDU in it.
 *
 * The file is closed before returning. Any failure while opening or reading the file
 * yields a failure report carrying the error message; this function does not throw.
 */
Report normalize(const std::string& filename);

/// Describes one HDU. Throws `fits::FitsException` on read errors.
HduDescriptor describe_hdu(fits::HDU& hdu, size_t index);

/// Reads the header records of an HDU in order, dropping blank keywords and joining
/// CONTINUE long strings.
Header read_header(fits::HDU& hdu);
}  // namespace fitsmeta
