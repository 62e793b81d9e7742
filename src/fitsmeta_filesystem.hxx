#pragma once

#if defined(FITSMETA_USE_BOOST)

#include <boost/filesystem.hpp>

namespace fitsmeta {
namespace fs = boost::filesystem;
}  // namespace fitsmeta

#elif defined(__cplusplus) && __cplusplus >= 201703

#include <filesystem>

namespace fitsmeta {
namespace fs = std::filesystem;
}  // namespace fitsmeta

#else
#error "Could not find a filesystem library"
#endif
