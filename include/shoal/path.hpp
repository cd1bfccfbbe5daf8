#ifndef SHOAL_PATH_HEADER
#define SHOAL_PATH_HEADER

#include <filesystem>

namespace shoal {

using std::filesystem::path;
namespace fs = std::filesystem;

} // namespace shoal

#endif // SHOAL_PATH_HEADER
