// core/config.cpp
#include "tmpltool/core/config.h"
#include "tmpltool/core/errors.h"
#include "common/utils/diagnostics.h"
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <stdexcept>

namespace tmpltool {

namespace {

const std::string& option_value(const std::vector<std::string>& args, size_t& i) {
    if (i + 1 >= args.size()) {
        throw std::invalid_argument("Option '" + args[i] + "' requires a value");
    }
    return args[++i];
}

IdeFormat parse_ide_format(const std::string& value) {
    if (value == "json") return IdeFormat::JSON;
    if (value == "yaml") return IdeFormat::YAML;
    throw std::invalid_argument("Invalid --ide format '" + value + "' (expected json or yaml)");
}

std::optional<size_t> positive_size(const Value& j, const std::string& key) {
    if (!j.contains(key)) return std::nullopt;
    const Value& v = j[key];
    if (v.is_number_unsigned() && v.get<unsigned long long>() > 0) {
        return static_cast<size_t>(v.get<unsigned long long>());
    }
    if (v.is_number_integer() && v.get<long long>() > 0) {
        return static_cast<size_t>(v.get<long long>());
    }
    log_warning("Ignoring config key 'exec." + key + "': expected a positive integer, got " + v.dump());
    return std::nullopt;
}

} // namespace

RenderOptions parse_cli_args(const std::vector<std::string>& args) {
    RenderOptions opts;
    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];
        if (arg == "-o" || arg == "--output") {
            opts.output_path = option_value(args, i);
        } else if (arg.rfind("--output=", 0) == 0) {
            opts.output_path = arg.substr(9);
        } else if (arg == "--trust") {
            opts.trust = true;
        } else if (arg == "-v" || arg == "--verbose") {
            opts.verbose = true;
        } else if (arg == "--config") {
            opts.config_path = option_value(args, i);
        } else if (arg.rfind("--config=", 0) == 0) {
            opts.config_path = arg.substr(9);
        } else if (arg == "--ide") {
            opts.ide = parse_ide_format(option_value(args, i));
        } else if (arg.rfind("--ide=", 0) == 0) {
            opts.ide = parse_ide_format(arg.substr(6));
        } else if (arg == "-h" || arg == "--help") {
            opts.show_help = true;
        } else if (arg == "-V" || arg == "--version") {
            opts.show_version = true;
        } else if (arg.size() > 1 && arg[0] == '-' && arg != "-") {
            throw std::invalid_argument("Unknown option '" + arg + "'");
        } else if (opts.template_path) {
            throw std::invalid_argument("Unexpected argument '" + arg + "': only one template may be given");
        } else {
            opts.template_path = arg;
        }
    }
    if (opts.output_path && opts.output_path->empty()) {
        throw std::invalid_argument("Output path must not be empty");
    }
    return opts;
}

std::string usage_text(const std::string& program) {
    return "Usage: " + program + " [OPTIONS] [TEMPLATE]\n"
           "\n"
           "Render TEMPLATE (or stdin when absent or '-') with environment variables as context.\n"
           "\n"
           "Options:\n"
           "  -o, --output <FILE>   Write output to FILE instead of stdout\n"
           "      --trust           Allow absolute paths, '..' and exec()/exec_raw()\n"
           "  -v, --verbose         Print debug diagnostics to stderr\n"
           "      --config <FILE>   JSON config file (default: $" + std::string(kConfigEnvVar) +
           " or " + kDefaultConfigFile + ")\n"
           "      --ide <FORMAT>    Print function metadata as json or yaml and exit\n"
           "  -h, --help            Print this help\n"
           "  -V, --version         Print version\n";
}

ToolConfig config_from_json(const Value& j) {
    ToolConfig config;
    if (!j.is_object()) {
        log_warning("Ignoring config: top level is not an object");
        return config;
    }

    if (j.contains("verbose")) {
        if (j["verbose"].is_boolean()) {
            config.verbose = j["verbose"].get<bool>();
        } else {
            log_warning("Ignoring config key 'verbose': expected a boolean");
        }
    }

    if (!j.contains("exec")) return config;
    const Value& exec = j["exec"];
    if (!exec.is_object()) {
        log_warning("Ignoring config key 'exec': expected an object");
        return config;
    }

    if (exec.contains("default_timeout")) {
        const Value& t = exec["default_timeout"];
        if (t.is_number_integer() && t.get<long long>() > 0) {
            config.exec.default_timeout = clamp_timeout(t.get<long long>());
        } else {
            log_warning("Ignoring config key 'exec.default_timeout': expected a positive integer, got " + t.dump());
        }
    }
    if (auto n = positive_size(exec, "max_output_bytes")) {
        config.exec.max_output_bytes = *n;
    }
    if (auto n = positive_size(exec, "max_concurrent")) {
        config.exec.max_concurrent = *n;
    }
    return config;
}

ToolConfig load_config(const std::optional<std::string>& explicit_path) {
    namespace fs = std::filesystem;

    std::string path;
    bool required = true;
    if (explicit_path) {
        path = *explicit_path;
    } else if (const char* from_env = std::getenv(kConfigEnvVar); from_env != nullptr && *from_env != '\0') {
        path = from_env;
    } else {
        path = kDefaultConfigFile;
        required = false;
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        if (required) {
            throw FileAccessError("Failed to read config file '" + path + "'");
        }
        return ToolConfig{};
    }

    Value j;
    try {
        file >> j;
    } catch (const nlohmann::json::parse_error& e) {
        throw FileAccessError("Failed to parse config file '" + path + "': " + e.what());
    }

    ToolConfig config = config_from_json(j);
    config.source = fs::absolute(path).string();
    return config;
}

} // namespace tmpltool
