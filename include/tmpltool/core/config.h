#ifndef TMPLTOOL_CORE_CONFIG_H
#define TMPLTOOL_CORE_CONFIG_H

#include "tmpltool/exec/command_gateway.h"
#include "tmpltool/common/types.h"
#include <optional>
#include <string>
#include <vector>

namespace tmpltool {

constexpr const char* kToolName = "tmpltool";
constexpr const char* kToolVersion = "1.2.0";
constexpr const char* kConfigEnvVar = "TMPLTOOL_CONFIG";
constexpr const char* kDefaultConfigFile = ".tmpltool.json";

enum class IdeFormat { NONE, JSON, YAML };

// Command line, as given. Trust is decided here and nowhere else.
struct RenderOptions {
    std::optional<std::string> template_path; // nullopt or "-" -> stdin
    std::optional<std::string> output_path;
    bool trust = false;
    bool verbose = false;
    std::optional<std::string> config_path;
    IdeFormat ide = IdeFormat::NONE;
    bool show_help = false;
    bool show_version = false;

    bool reads_stdin() const { return !template_path || *template_path == "-"; }
};

struct ExecConfig {
    unsigned default_timeout = kDefaultExecTimeoutSec;
    size_t max_output_bytes = kDefaultMaxOutputBytes;
    size_t max_concurrent = kDefaultMaxConcurrentCommands;
};

struct ToolConfig {
    ExecConfig exec;
    bool verbose = false;
    std::optional<std::string> source; // file the values came from, if any
};

// argv without the program name. Throws std::invalid_argument on unknown
// options, missing option values or a second template path.
RenderOptions parse_cli_args(const std::vector<std::string>& args);

std::string usage_text(const std::string& program);

// Keys that are present but of the wrong type or out of range are ignored
// with a warning; defaults fill in everything else.
ToolConfig config_from_json(const Value& j);

// --config, else $TMPLTOOL_CONFIG, else ./.tmpltool.json when it exists.
// An explicitly named file that cannot be read, or any file that is not
// valid JSON, is a FileAccessError.
ToolConfig load_config(const std::optional<std::string>& explicit_path);

} // namespace tmpltool

#endif // TMPLTOOL_CORE_CONFIG_H
