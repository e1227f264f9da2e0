// src/functions/registry.cpp
#include "tmpltool/functions/registry.h"
#include "tmpltool/core/errors.h"
#include <algorithm>
#include <cmath>
#include <limits>

namespace tmpltool {

const FunctionRegistry::Entry& FunctionRegistry::find(const std::string& name) const {
    auto it = functions_.find(name);
    if (it == functions_.end()) {
        throw ArgumentError("Function '" + name + "' not found");
    }
    return it->second;
}

const FunctionRegistry::Entry& FunctionRegistry::enter(const std::string& name) const {
    const Entry& entry = find(name);
    if (entry.precondition) {
        entry.precondition();
    }
    return entry;
}

bool FunctionRegistry::has_function(const std::string& name) const {
    return functions_.count(name) > 0;
}

const FunctionMetadata& FunctionRegistry::metadata(const std::string& name) const {
    return find(name).metadata;
}

Value FunctionRegistry::call_function(const std::string& name, const Kwargs& kwargs) const {
    const Entry& entry = enter(name);

    for (const auto& [key, _] : kwargs) {
        bool known = std::any_of(entry.metadata.arguments.begin(), entry.metadata.arguments.end(),
                                 [&](const ArgumentMetadata& arg) { return arg.name == key; });
        if (!known) {
            throw ArgumentError(name + "() got an unexpected argument '" + key + "'");
        }
    }
    for (const auto& arg : entry.metadata.arguments) {
        if (arg.required && kwargs.count(arg.name) == 0) {
            throw ArgumentError(name + "() missing required argument '" + arg.name + "'");
        }
    }

    return entry.handler(kwargs);
}

Kwargs FunctionRegistry::bind_arguments(const std::string& name, const std::vector<const Value*>& positional) const {
    const FunctionMetadata& meta = enter(name).metadata;
    Kwargs kwargs;

    bool object_form = positional.size() == 1 && positional[0]->is_object() &&
                       (meta.arguments.empty() || meta.arguments[0].type != "object");
    if (object_form) {
        for (const auto& [key, value] : positional[0]->items()) {
            kwargs[key] = value;
        }
        return kwargs;
    }

    if (positional.size() > meta.arguments.size()) {
        throw ArgumentError(name + "() takes at most " + std::to_string(meta.arguments.size()) +
                            " arguments (" + std::to_string(positional.size()) + " given)");
    }
    for (size_t i = 0; i < positional.size(); ++i) {
        kwargs[meta.arguments[i].name] = *positional[i];
    }
    return kwargs;
}

std::vector<int> FunctionRegistry::accepted_arities(const std::string& name) const {
    const FunctionMetadata& meta = find(name).metadata;
    std::vector<int> arities;
    for (size_t n = meta.required_count(); n <= meta.arguments.size(); ++n) {
        arities.push_back(static_cast<int>(n));
    }
    // keyword form is always a single object
    if (std::find(arities.begin(), arities.end(), 1) == arities.end()) {
        arities.push_back(1);
    }
    return arities;
}

std::vector<std::string> FunctionRegistry::list_functions() const {
    std::vector<std::string> names;
    names.reserve(functions_.size());
    for (const auto& [name, _] : functions_) {
        names.push_back(name);
    }
    std::sort(names.begin(), names.end());
    return names;
}

std::vector<const FunctionMetadata*> FunctionRegistry::all_metadata() const {
    std::vector<const FunctionMetadata*> out;
    for (const auto& name : list_functions()) {
        out.push_back(&functions_.at(name).metadata);
    }
    return out;
}

std::string get_string_arg(const Kwargs& kwargs, const std::string& function, const std::string& key) {
    auto it = kwargs.find(key);
    if (it == kwargs.end()) {
        throw ArgumentError(function + "() missing required argument '" + key + "'");
    }
    if (!it->second.is_string()) {
        throw ArgumentError(function + "() argument '" + key + "' must be a string, got " +
                            it->second.type_name());
    }
    return it->second.get<std::string>();
}

std::optional<long long> get_optional_int_arg(const Kwargs& kwargs, const std::string& function, const std::string& key) {
    auto it = kwargs.find(key);
    if (it == kwargs.end() || it->second.is_null()) {
        return std::nullopt;
    }
    const Value& v = it->second;
    if (v.is_number_unsigned()) {
        if (v.get<unsigned long long>() <= static_cast<unsigned long long>(std::numeric_limits<long long>::max())) {
            return v.get<long long>();
        }
    } else if (v.is_number_integer()) {
        return v.get<long long>();
    } else if (v.is_number_float()) {
        // [-2^63, 2^63) converts without overflow
        constexpr double kLimit = 9223372036854775808.0;
        double d = v.get<double>();
        if (std::isfinite(d) && std::floor(d) == d && d >= -kLimit && d < kLimit) {
            return static_cast<long long>(d);
        }
    }
    throw ArgumentError(function + "() argument '" + key + "' must be an integer, got " + v.dump());
}

} // namespace tmpltool
