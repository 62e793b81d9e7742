#include "get_env.hxx"

// Standard library
#include <cstdlib>

namespace fitsmeta {
std::string get_env(char const* name) {
    char const* value = std::getenv(name);
    return value ? std::string(value) : std::string();
}
}  // namespace fitsmeta
