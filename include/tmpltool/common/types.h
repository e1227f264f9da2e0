#ifndef TMPLTOOL_COMMON_TYPES_H
#define TMPLTOOL_COMMON_TYPES_H

#include <nlohmann/json.hpp> // inja 依赖 nlohmann/json
#include <functional>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace tmpltool {

// nlohmann::json is the one value type shared by templates, helpers and results
using Value = nlohmann::json;
using Context = nlohmann::json;

// Named arguments of a helper call, already bound from the engine's call site
using Kwargs = std::unordered_map<std::string, Value>;

using HelperFunction = std::function<Value(const Kwargs&)>;

struct ArgumentMetadata {
    std::string name;
    std::string type;                   // "string", "integer", "boolean", ...
    bool required = true;
    std::optional<std::string> default_value;
    std::string description;
};

struct FunctionMetadata {
    std::string name;
    std::string category;               // "filesystem", "exec", "data_parsing", "environment"
    std::string description;
    std::vector<ArgumentMetadata> arguments;
    std::string return_type;
    std::vector<std::string> examples;

    size_t required_count() const {
        size_t n = 0;
        for (const auto& arg : arguments) {
            if (arg.required) ++n;
        }
        return n;
    }
};

} // namespace tmpltool

#endif // TMPLTOOL_COMMON_TYPES_H
