#ifndef TMPLTOOL_COMMON_UTILS_GLOB_MATCHER_H
#define TMPLTOOL_COMMON_UTILS_GLOB_MATCHER_H

#include <filesystem>
#include <functional>
#include <regex>
#include <string>
#include <string_view>
#include <vector>

namespace tmpltool {

// True if the component has *, ? or [
bool has_glob_magic(std::string_view component);

// One path component ("*.json", "file?.[ch]") -> anchored regex.
// Throws ArgumentError on an unterminated character class.
std::regex glob_component_to_regex(std::string_view component);

// Asked before the walker lists a directory; false skips it
using DirectoryFilter = std::function<bool(const std::filesystem::path&)>;

// Expands an absolute pattern. "**" as a whole component matches zero or
// more directories; symlinked directories are not descended into by "**".
// Result is sorted and free of duplicates.
std::vector<std::filesystem::path> expand_glob(const std::string& absolute_pattern,
                                               const DirectoryFilter& may_enter = DirectoryFilter());

} // namespace tmpltool

#endif // TMPLTOOL_COMMON_UTILS_GLOB_MATCHER_H
