#pragma once

// Standard library
#include <iosfwd>

namespace fitsmeta {

/** Runs the command-line tool.
 *
 * Prints the JSON report of the file named on the command line to `out` and returns the
 * process exit status. Usage errors return 1.
 */
int run(int argc, char const* const* argv, std::ostream& out, std::ostream& err);
}  // namespace fitsmeta
