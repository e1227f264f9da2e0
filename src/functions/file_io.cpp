// src/functions/file_io.cpp
#include "functions/file_io.h"
#include "tmpltool/core/errors.h"
#include "common/utils/text.h"
#include <cerrno>
#include <cstring>
#include <fstream>
#include <sstream>
#include <sys/stat.h>

namespace tmpltool {

std::string read_text_file(const SandboxedPath& path) {
    const std::string shown = path.path().string();

    struct stat st;
    if (::stat(shown.c_str(), &st) != 0) {
        throw FileAccessError("Failed to read file '" + shown + "': " + std::strerror(errno));
    }
    if (S_ISDIR(st.st_mode)) {
        throw FileAccessError("Failed to read file '" + shown + "': Is a directory");
    }

    std::ifstream file(path.path(), std::ios::binary);
    if (!file.is_open()) {
        throw FileAccessError("Failed to read file '" + shown + "': " + std::strerror(errno));
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    if (file.bad()) {
        throw FileAccessError("Failed to read file '" + shown + "': read error");
    }

    std::string content = buffer.str();
    if (!is_valid_utf8(content)) {
        throw FileAccessError("Failed to read file '" + shown + "': stream did not contain valid UTF-8");
    }
    return content;
}

FileStat stat_file(const SandboxedPath& path) {
    const std::string shown = path.path().string();
    struct stat st;
    if (::stat(shown.c_str(), &st) != 0) {
        throw FileAccessError("Failed to get file metadata for '" + shown + "': " + std::strerror(errno));
    }
    FileStat out;
    out.size = static_cast<uint64_t>(st.st_size);
    out.modified_unix = static_cast<int64_t>(st.st_mtime);
    return out;
}

} // namespace tmpltool
