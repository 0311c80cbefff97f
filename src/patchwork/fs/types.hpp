#ifndef PATCHWORK_FS_TYPES_HPP
#define PATCHWORK_FS_TYPES_HPP

#include <filesystem>

#include <patchwork/core/type_definitions.hpp>

namespace patchwork {

// (file_path is slightly incorrect because the path could refer to a
// directory, but it's a lot easier to read.)
typedef std::filesystem::path file_path;

} // namespace patchwork

#endif
