#ifndef TMPLTOOL_CORE_RENDERER_H
#define TMPLTOOL_CORE_RENDERER_H

#include "tmpltool/common/types.h"
#include "tmpltool/functions/registry.h"
#include "tmpltool/sandbox/path_sandbox.h"
#include <inja/inja.hpp>
#include <optional>
#include <string>
#include <string_view>

namespace tmpltool {

// inja environment wired to a FunctionRegistry and a PathSandbox.
//
// Every registered helper becomes one inja callback per accepted arity;
// {% include %} and {% extends %} read files through the sandbox only.
// The registry must outlive the renderer.
class TemplateRenderer {
public:
    TemplateRenderer(const FunctionRegistry& registry, PathSandbox sandbox);

    TemplateRenderer(const TemplateRenderer&) = delete;
    TemplateRenderer& operator=(const TemplateRenderer&) = delete;

    // Whole output or RenderError; never a partial result
    std::string render(std::string_view template_str, const Context& data);

private:
    void configure_includes();
    void install_functions();

    const FunctionRegistry& registry_;
    PathSandbox sandbox_;
    inja::Environment env_;
    std::optional<std::string> failing_function_;
};

// Process environment as a flat JSON object of strings
Context build_environment_context();

} // namespace tmpltool

#endif // TMPLTOOL_CORE_RENDERER_H
