// src/functions/filesystem_functions.cpp
#include "tmpltool/functions/builtins.h"
#include "tmpltool/core/errors.h"
#include "functions/file_io.h"
#include "common/utils/glob_matcher.h"
#include "common/utils/text.h"
#include <algorithm>
#include <filesystem>
#include <system_error>

namespace tmpltool {

namespace fs = std::filesystem;

namespace {

constexpr long long kReadLinesDefault = 10;
constexpr long long kReadLinesLimit = 10000;

ArgumentMetadata path_argument(const std::string& description) {
    return ArgumentMetadata{"path", "string", true, std::nullopt, description};
}

FunctionMetadata path_function(const std::string& name, const std::string& description,
                               const std::string& return_type, std::vector<std::string> examples) {
    return FunctionMetadata{name, "filesystem", description, {path_argument("Path relative to the working directory")},
                            return_type, std::move(examples)};
}

Value read_lines(const PathSandbox& sandbox, const Kwargs& kwargs) {
    std::string raw = get_string_arg(kwargs, "read_lines", "path");
    long long max_lines = get_optional_int_arg(kwargs, "read_lines", "max_lines").value_or(kReadLinesDefault);
    if (max_lines < -kReadLinesLimit || max_lines > kReadLinesLimit) {
        throw ArgumentError("max_lines absolute value must be between 0 and " + std::to_string(kReadLinesLimit) +
                            ", got " + std::to_string(max_lines));
    }

    SandboxedPath path = sandbox.validate(raw);
    std::vector<std::string> lines = split_lines(read_text_file(path));

    size_t begin = 0;
    size_t end = lines.size();
    if (max_lines > 0) {
        end = std::min(lines.size(), static_cast<size_t>(max_lines));
    } else if (max_lines < 0) {
        size_t n = static_cast<size_t>(-max_lines);
        begin = lines.size() > n ? lines.size() - n : 0;
    }
    return Value(std::vector<std::string>(lines.begin() + begin, lines.begin() + end));
}

Value list_dir(const PathSandbox& sandbox, const Kwargs& kwargs) {
    SandboxedPath path = sandbox.validate(get_string_arg(kwargs, "list_dir", "path"));

    std::error_code ec;
    fs::directory_iterator it(path.path(), ec);
    if (ec) {
        throw FileAccessError("Failed to read directory '" + path.path().string() + "': " + ec.message());
    }
    std::vector<std::string> names;
    for (; it != fs::directory_iterator(); it.increment(ec)) {
        if (ec) {
            throw FileAccessError("Failed to read directory entry: " + ec.message());
        }
        names.push_back(it->path().filename().string());
    }
    if (ec) {
        throw FileAccessError("Failed to read directory entry: " + ec.message());
    }
    std::sort(names.begin(), names.end());
    return Value(names);
}

Value glob(const PathSandbox& sandbox, const Kwargs& kwargs) {
    std::string pattern = sandbox.resolve_glob(get_string_arg(kwargs, "glob", "pattern"));

    auto inside = [&sandbox](const fs::path& dir) { return sandbox.contains_resolved(dir); };

    std::vector<std::string> files;
    for (const auto& match : expand_glob(pattern, inside)) {
        // symlinks inside the tree must not surface files outside it
        if (!sandbox.contains_resolved(match)) continue;
        files.push_back(match.string());
    }
    std::sort(files.begin(), files.end());
    return Value(files);
}

} // namespace

void register_filesystem_functions(FunctionRegistry& registry, const PathSandbox& sandbox) {
    registry.register_function(
        path_function("read_file", "Read file contents as string", "string",
                      {"{{ read_file(\"config.txt\") }}", "{% set content = read_file(\"data.json\") %}"}),
        [sandbox](const Kwargs& kwargs) -> Value {
            return read_text_file(sandbox.validate(get_string_arg(kwargs, "read_file", "path")));
        });

    registry.register_function(
        path_function("file_exists", "Check if a file or directory exists", "boolean",
                      {"{% if file_exists(\"config.json\") %}Config found{% endif %}"}),
        [sandbox](const Kwargs& kwargs) -> Value {
            SandboxedPath path = sandbox.validate(get_string_arg(kwargs, "file_exists", "path"));
            std::error_code ec;
            return fs::exists(path.path(), ec);
        });

    registry.register_function(
        path_function("is_file", "Check if path is a regular file", "boolean",
                      {"{% if is_file(\"config.json\") %}config exists{% endif %}"}),
        [sandbox](const Kwargs& kwargs) -> Value {
            SandboxedPath path = sandbox.validate(get_string_arg(kwargs, "is_file", "path"));
            std::error_code ec;
            return fs::is_regular_file(path.path(), ec);
        });

    registry.register_function(
        path_function("is_dir", "Check if path is a directory", "boolean",
                      {"{% if is_dir(\"src\") %}source directory exists{% endif %}"}),
        [sandbox](const Kwargs& kwargs) -> Value {
            SandboxedPath path = sandbox.validate(get_string_arg(kwargs, "is_dir", "path"));
            std::error_code ec;
            return fs::is_directory(path.path(), ec);
        });

    registry.register_function(
        path_function("is_symlink", "Check if path is a symbolic link", "boolean",
                      {"{% if is_symlink(\"current\") %}linked{% endif %}"}),
        [sandbox](const Kwargs& kwargs) -> Value {
            SandboxedPath path = sandbox.validate(get_string_arg(kwargs, "is_symlink", "path"));
            std::error_code ec;
            return fs::is_symlink(fs::symlink_status(path.path(), ec));
        });

    registry.register_function(
        path_function("list_dir", "List files and directories in a directory (sorted)", "array",
                      {"{% for file in list_dir(\".\") %}{{ file }}{% endfor %}"}),
        [sandbox](const Kwargs& kwargs) -> Value { return list_dir(sandbox, kwargs); });

    registry.register_function(
        FunctionMetadata{"glob", "filesystem", "List files matching a glob pattern (sorted absolute paths)",
                         {ArgumentMetadata{"pattern", "string", true, std::nullopt,
                                           "Glob pattern (e.g., \"*.txt\", \"**/*.json\")"}},
                         "array",
                         {"{% for f in glob(\"*.txt\") %}{{ f }}{% endfor %}",
                          "{{ length(glob(\"src/**/*.cpp\")) }}"}},
        [sandbox](const Kwargs& kwargs) -> Value { return glob(sandbox, kwargs); });

    registry.register_function(
        path_function("file_size", "Get file size in bytes", "integer", {"{{ file_size(\"data.bin\") }}"}),
        [sandbox](const Kwargs& kwargs) -> Value {
            return stat_file(sandbox.validate(get_string_arg(kwargs, "file_size", "path"))).size;
        });

    registry.register_function(
        path_function("file_modified", "Get file modification timestamp (Unix epoch seconds)", "integer",
                      {"{{ file_modified(\"data.txt\") }}"}),
        [sandbox](const Kwargs& kwargs) -> Value {
            return stat_file(sandbox.validate(get_string_arg(kwargs, "file_modified", "path"))).modified_unix;
        });

    registry.register_function(
        FunctionMetadata{"read_lines", "filesystem", "Read lines from a file",
                         {path_argument("Path to the file"),
                          ArgumentMetadata{"max_lines", "integer", false, std::string("10"),
                                           "Number of lines to read (positive=first N, negative=last N, 0=all)"}},
                         "array",
                         {"{{ read_lines(\"log.txt\", 5) }}", "{{ read_lines(\"log.txt\", -5) }}"}},
        [sandbox](const Kwargs& kwargs) -> Value { return read_lines(sandbox, kwargs); });
}

} // namespace tmpltool
