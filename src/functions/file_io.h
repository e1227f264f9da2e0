#ifndef TMPLTOOL_FUNCTIONS_FILE_IO_H
#define TMPLTOOL_FUNCTIONS_FILE_IO_H

#include "tmpltool/sandbox/path_sandbox.h"
#include <cstdint>
#include <string>

namespace tmpltool {

// Whole file as UTF-8 text; FileAccessError on open/read failure or bad UTF-8
std::string read_text_file(const SandboxedPath& path);

struct FileStat {
    uint64_t size = 0;
    int64_t modified_unix = 0;
};

// stat(2) following symlinks; FileAccessError on failure
FileStat stat_file(const SandboxedPath& path);

} // namespace tmpltool

#endif // TMPLTOOL_FUNCTIONS_FILE_IO_H
