// cli/app.cpp
#include "tmpltool/cli/app.h"
#include "tmpltool/core/errors.h"
#include "tmpltool/core/renderer.h"
#include "tmpltool/core/trust.h"
#include "tmpltool/exec/command_gateway.h"
#include "tmpltool/functions/builtins.h"
#include "tmpltool/sandbox/path_sandbox.h"
#include "common/utils/diagnostics.h"
#include "common/utils/yaml_json.h"
#include <cerrno>
#include <cstring>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace tmpltool {

namespace {

std::string read_template(const RenderOptions& opts, std::istream& in) {
    std::stringstream buffer;
    if (opts.reads_stdin()) {
        buffer << in.rdbuf();
        if (in.bad()) {
            throw FileAccessError("Failed to read template from stdin");
        }
        return buffer.str();
    }

    std::ifstream file(*opts.template_path, std::ios::binary);
    if (!file.is_open()) {
        throw FileAccessError("Failed to read template file '" + *opts.template_path + "': " +
                              std::strerror(errno));
    }
    buffer << file.rdbuf();
    return buffer.str();
}

void write_output(const std::string& path, const std::string& content) {
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file.is_open()) {
        throw FileAccessError("Failed to write output file '" + path + "': " + std::strerror(errno));
    }
    file << content;
    file.flush();
    if (!file) {
        throw FileAccessError("Failed to write output file '" + path + "'");
    }
}

} // namespace

Value export_function_metadata(const FunctionRegistry& registry) {
    Value functions = Value::array();
    for (const FunctionMetadata* meta : registry.all_metadata()) {
        Value args = Value::array();
        for (const auto& arg : meta->arguments) {
            Value a = Value::object();
            a["name"] = arg.name;
            a["type"] = arg.type;
            a["required"] = arg.required;
            a["default"] = arg.default_value ? Value(*arg.default_value) : Value(nullptr);
            a["description"] = arg.description;
            args.push_back(std::move(a));
        }
        Value f = Value::object();
        f["name"] = meta->name;
        f["category"] = meta->category;
        f["description"] = meta->description;
        f["arguments"] = std::move(args);
        f["return_type"] = meta->return_type;
        f["examples"] = meta->examples;
        functions.push_back(std::move(f));
    }

    Value catalog = Value::object();
    catalog["version"] = kToolVersion;
    catalog["functions"] = std::move(functions);
    return catalog;
}

std::string format_function_metadata(const FunctionRegistry& registry, IdeFormat format) {
    Value catalog = export_function_metadata(registry);
    if (format == IdeFormat::YAML) {
        return json_to_yaml(catalog) + "\n";
    }
    return catalog.dump(2) + "\n";
}

int run_cli(const std::vector<std::string>& args, std::istream& in, std::ostream& out, std::ostream& err) {
    RenderOptions opts;
    try {
        opts = parse_cli_args(args);
    } catch (const std::invalid_argument& e) {
        err << "Error: " << e.what() << "\n\n" << usage_text(kToolName);
        return 1;
    }

    if (opts.show_help) {
        out << usage_text(kToolName);
        return 0;
    }
    if (opts.show_version) {
        out << kToolName << " " << kToolVersion << "\n";
        return 0;
    }

    try {
        ToolConfig config = load_config(opts.config_path);
        set_verbose(opts.verbose || config.verbose);
        if (config.source) {
            log_debug("config loaded from " + *config.source);
        }

        TrustContext trust(opts.trust);
        WorkingRoot root = WorkingRoot::capture();
        log_debug(std::string("trust mode ") + (trust.trusted() ? "on" : "off") + ", working root " +
                  root.path().string());

        PathSandbox sandbox(root, trust);
        CommandGateway gateway(trust, GatewayLimits{config.exec.max_output_bytes, config.exec.max_concurrent});
        FunctionRegistry registry;
        register_all_functions(registry, sandbox, gateway, config.exec.default_timeout);

        if (opts.ide != IdeFormat::NONE) {
            out << format_function_metadata(registry, opts.ide);
            return 0;
        }

        std::string source = read_template(opts, in);
        TemplateRenderer renderer(registry, sandbox);
        std::string rendered = renderer.render(source, build_environment_context());

        if (opts.output_path) {
            write_output(*opts.output_path, rendered);
            err << "Successfully rendered template to '" << *opts.output_path << "'\n";
        } else {
            out << rendered;
            out.flush();
        }
        return 0;
    } catch (const std::exception& e) {
        err << "Error: " << e.what() << "\n";
        return 1;
    }
}

int run_cli(int argc, char* argv[]) {
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) {
        args.emplace_back(argv[i]);
    }
    return run_cli(args, std::cin, std::cout, std::cerr);
}

} // namespace tmpltool
