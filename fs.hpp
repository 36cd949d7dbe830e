#ifndef FS_DOT_HPP
#define FS_DOT_HPP

// Paths of eml and settings files, and the checks on them.

#include <filesystem>
namespace fs = std::filesystem;

#endif // FS_DOT_HPP
