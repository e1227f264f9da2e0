// src/functions/data_file_functions.cpp
#include "tmpltool/functions/builtins.h"
#include "tmpltool/core/errors.h"
#include "functions/file_io.h"
#include "common/utils/toml_json.h"
#include "common/utils/yaml_json.h"
#include <sstream>
#include <stdexcept>

namespace tmpltool {

namespace {

Value read_json_file(const PathSandbox& sandbox, const Kwargs& kwargs) {
    SandboxedPath path = sandbox.validate(get_string_arg(kwargs, "read_json_file", "path"));
    std::string content = read_text_file(path);
    try {
        return Value::parse(content);
    } catch (const nlohmann::json::parse_error& e) {
        throw FileAccessError("Failed to parse JSON from file '" + path.raw() + "': " + e.what());
    }
}

Value read_yaml_file(const PathSandbox& sandbox, const Kwargs& kwargs) {
    SandboxedPath path = sandbox.validate(get_string_arg(kwargs, "read_yaml_file", "path"));
    std::string content = read_text_file(path);
    try {
        return parse_yaml_document(content);
    } catch (const YAML::Exception& e) {
        throw FileAccessError("Failed to parse YAML from file '" + path.raw() + "': " + e.what());
    }
}

Value read_toml_file(const PathSandbox& sandbox, const Kwargs& kwargs) {
    SandboxedPath path = sandbox.validate(get_string_arg(kwargs, "read_toml_file", "path"));
    std::string content = read_text_file(path);
    try {
        return parse_toml_document(content, path.raw());
    } catch (const toml::parse_error& e) {
        std::ostringstream msg;
        msg << e.description() << " (line " << e.source().begin.line << ", column " << e.source().begin.column
            << ")";
        throw FileAccessError("Failed to parse TOML from file '" + path.raw() + "': " + msg.str());
    } catch (const std::invalid_argument& e) {
        throw FileAccessError(std::string("Failed to convert TOML to JSON: ") + e.what());
    }
}

} // namespace

void register_data_file_functions(FunctionRegistry& registry, const PathSandbox& sandbox) {
    registry.register_function(
        FunctionMetadata{"read_json_file", "data_parsing", "Read and parse a JSON file",
                         {ArgumentMetadata{"path", "string", true, std::nullopt, "Path to the JSON file"}},
                         "object",
                         {"{% set config = read_json_file(\"config.json\") %}{{ config.name }}"}},
        [sandbox](const Kwargs& kwargs) -> Value { return read_json_file(sandbox, kwargs); });

    registry.register_function(
        FunctionMetadata{"read_yaml_file", "data_parsing", "Read and parse a YAML file",
                         {ArgumentMetadata{"path", "string", true, std::nullopt, "Path to the YAML file"}},
                         "object",
                         {"{% set values = read_yaml_file(\"values.yaml\") %}{{ values.image.tag }}"}},
        [sandbox](const Kwargs& kwargs) -> Value { return read_yaml_file(sandbox, kwargs); });

    registry.register_function(
        FunctionMetadata{"read_toml_file", "data_parsing", "Read and parse a TOML file",
                         {ArgumentMetadata{"path", "string", true, std::nullopt, "Path to the TOML file"}},
                         "object",
                         {"{% set cargo = read_toml_file(\"Cargo.toml\") %}{{ cargo.package.version }}"}},
        [sandbox](const Kwargs& kwargs) -> Value { return read_toml_file(sandbox, kwargs); });
}

} // namespace tmpltool
