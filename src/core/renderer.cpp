// core/renderer.cpp
#include "tmpltool/core/renderer.h"
#include "tmpltool/core/errors.h"
#include "functions/file_io.h"
#include "common/utils/diagnostics.h"
#include "common/utils/text.h"
#include <utility>

extern char** environ;

namespace tmpltool {

TemplateRenderer::TemplateRenderer(const FunctionRegistry& registry, PathSandbox sandbox)
    : registry_(registry), sandbox_(std::move(sandbox)), env_() {
    env_.set_expression("{{", "}}");
    env_.set_statement("{%", "%}");
    env_.set_comment("{#", "#}");
    env_.set_line_statement("##");

    configure_includes();
    install_functions();
}

void TemplateRenderer::configure_includes() {
    // inja would otherwise open included files itself, bypassing the sandbox
    env_.set_search_included_templates_in_files(false);
    env_.set_include_callback([this](const std::filesystem::path&, const std::string& name) -> inja::Template {
        log_debug("include '" + name + "'");
        try {
            return env_.parse(read_text_file(sandbox_.validate(name)));
        } catch (const ToolError&) {
            failing_function_ = "include";
            throw;
        }
    });
}

void TemplateRenderer::install_functions() {
    for (const auto& name : registry_.list_functions()) {
        for (int arity : registry_.accepted_arities(name)) {
            env_.add_callback(name, arity, [this, name](inja::Arguments& args) -> Value {
                try {
                    Kwargs kwargs = registry_.bind_arguments(name, args);
                    return registry_.call_function(name, kwargs);
                } catch (const ToolError&) {
                    failing_function_ = name;
                    throw;
                }
            });
        }
    }
}

std::string TemplateRenderer::render(std::string_view template_str, const Context& data) {
    failing_function_.reset();
    try {
        return env_.render(template_str, data);
    } catch (const RenderError&) {
        throw;
    } catch (const ToolError& e) {
        log_debug(std::string("render aborted by ") + to_string(e.kind()) + " error" +
                  (failing_function_ ? " in " + *failing_function_ + "()" : std::string()));
        std::optional<SourceLocation> location;
        std::string message = e.what();
        if (failing_function_) {
            location = failing_function_ == "include" ? std::nullopt
                                                      : find_call_site(template_str, *failing_function_);
            message += "\n  in " + *failing_function_ + "()";
            if (location) {
                message += " at line " + std::to_string(location->line) + ", column " +
                           std::to_string(location->column);
            }
        }
        throw RenderError(message, location, e.kind());
    } catch (const inja::InjaError& e) {
        SourceLocation location{e.location.line, e.location.column};
        throw RenderError("Template " + e.type + " error at line " + std::to_string(location.line) +
                              ", column " + std::to_string(location.column) + ": " + e.message,
                          location);
    }
}

Context build_environment_context() {
    Context context = Context::object();
    for (char** entry = environ; entry != nullptr && *entry != nullptr; ++entry) {
        std::string_view kv(*entry);
        size_t eq = kv.find('=');
        if (eq == std::string_view::npos || eq == 0) continue;
        std::string value(kv.substr(eq + 1));
        // json::dump rejects invalid UTF-8
        context[std::string(kv.substr(0, eq))] = sanitize_utf8(value);
    }
    return context;
}

} // namespace tmpltool
