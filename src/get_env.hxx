#pragma once

// Standard library
#include <string>

namespace fitsmeta {
// Returns the value of an environment variable, or an empty string if it is not set.
std::string get_env(char const* name);
}  // namespace fitsmeta
