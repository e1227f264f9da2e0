#ifndef TMPLTOOL_FUNCTIONS_REGISTRY_H
#define TMPLTOOL_FUNCTIONS_REGISTRY_H

#include "tmpltool/common/types.h"
#include <functional>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace tmpltool {

// Name -> (metadata, handler). The only place where the engine's dynamic
// "name + arguments" calls are turned into typed helper invocations.
class FunctionRegistry {
public:
    using Precondition = std::function<void()>;

    FunctionRegistry() = default;

    template<typename Func>
    void register_function(FunctionMetadata metadata, Func&& func) {
        register_function(std::move(metadata), std::forward<Func>(func), Precondition());
    }

    // `precondition` runs before any argument is bound or checked, so a
    // capability error wins over an argument error.
    template<typename Func>
    void register_function(FunctionMetadata metadata, Func&& func, Precondition precondition) {
        std::string name = metadata.name;
        functions_[std::move(name)] =
            Entry{std::move(metadata), HelperFunction(std::forward<Func>(func)), std::move(precondition)};
    }

    bool has_function(const std::string& name) const;

    // Runs the precondition, checks names and required arguments against
    // the metadata, then calls.
    // Helper exceptions propagate unchanged.
    Value call_function(const std::string& name, const Kwargs& kwargs) const;

    // Positional call site -> Kwargs. A single JSON object argument is taken
    // as keyword arguments: f({"path": "a.txt"}) == f("a.txt").
    Kwargs bind_arguments(const std::string& name, const std::vector<const Value*>& positional) const;

    // Argument counts the engine should accept for `name`
    std::vector<int> accepted_arities(const std::string& name) const;

    const FunctionMetadata& metadata(const std::string& name) const;

    // Sorted by name
    std::vector<std::string> list_functions() const;
    std::vector<const FunctionMetadata*> all_metadata() const;

private:
    struct Entry {
        FunctionMetadata metadata;
        HelperFunction handler;
        Precondition precondition;
    };

    const Entry& find(const std::string& name) const;
    // find() plus the entry's precondition
    const Entry& enter(const std::string& name) const;

    std::unordered_map<std::string, Entry> functions_;
};

// Argument accessors for helper bodies; errors name the helper and argument
std::string get_string_arg(const Kwargs& kwargs, const std::string& function, const std::string& key);
std::optional<long long> get_optional_int_arg(const Kwargs& kwargs, const std::string& function, const std::string& key);

} // namespace tmpltool

#endif // TMPLTOOL_FUNCTIONS_REGISTRY_H
