// common/utils/glob_matcher.cpp
#include "common/utils/glob_matcher.h"
#include "tmpltool/core/errors.h"
#include <algorithm>
#include <set>
#include <system_error>

namespace tmpltool {

namespace fs = std::filesystem;

bool has_glob_magic(std::string_view component) {
    return component.find_first_of("*?[") != std::string_view::npos;
}

std::regex glob_component_to_regex(std::string_view component) {
    std::string re;
    re.reserve(component.size() * 2);
    for (size_t i = 0; i < component.size(); ++i) {
        char c = component[i];
        switch (c) {
            case '*':
                re += "[^/]*";
                break;
            case '?':
                re += "[^/]";
                break;
            case '[': {
                size_t close = i + 1;
                if (close < component.size() && (component[close] == '!' || component[close] == '^')) ++close;
                if (close < component.size() && component[close] == ']') ++close; // literal ']' first
                close = component.find(']', close);
                if (close == std::string_view::npos) {
                    throw ArgumentError("Invalid glob pattern '" + std::string(component) +
                                        "': unterminated character class");
                }
                std::string_view body = component.substr(i + 1, close - i - 1);
                re += '[';
                if (!body.empty() && (body.front() == '!' || body.front() == '^')) {
                    re += '^';
                    body.remove_prefix(1);
                }
                for (char b : body) {
                    if (b == '\\' || b == '[' || b == ']') re += '\\';
                    re += b;
                }
                re += ']';
                i = close;
                break;
            }
            case '.': case '+': case '(': case ')': case '{': case '}':
            case '|': case '\\': case '^': case '$': case ']':
                re += '\\';
                re += c;
                break;
            default:
                re += c;
        }
    }
    return std::regex(re, std::regex::ECMAScript);
}

namespace {

class GlobWalker {
public:
    GlobWalker(std::vector<std::string> components, const DirectoryFilter& may_enter)
        : components_(std::move(components)), may_enter_(may_enter) {
        regexes_.reserve(components_.size());
        for (const auto& comp : components_) {
            if (comp != "**" && has_glob_magic(comp)) {
                regexes_.push_back(glob_component_to_regex(comp));
            } else {
                regexes_.emplace_back();
            }
        }
    }

    void expand(const fs::path& base, size_t idx) {
        std::error_code ec;
        if (idx == components_.size()) {
            if (fs::exists(fs::symlink_status(base, ec))) {
                matches_.insert(base);
            }
            return;
        }

        const std::string& comp = components_[idx];
        bool last = idx + 1 == components_.size();

        if (comp.empty() || comp == ".") {
            expand(base, idx + 1);
            return;
        }

        if (comp == "**") {
            if (!allowed(base)) return;
            expand(base, idx + 1);
            if (!fs::is_directory(base, ec)) return;
            fs::recursive_directory_iterator it(base, fs::directory_options::skip_permission_denied, ec);
            for (; !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
                if (it->is_directory(ec) && !it->is_symlink(ec)) {
                    if (!allowed(it->path())) {
                        it.disable_recursion_pending();
                        continue;
                    }
                    expand(it->path(), idx + 1);
                }
            }
            return;
        }

        if (!has_glob_magic(comp)) {
            fs::path next = base / comp;
            if (last) {
                if (fs::exists(fs::symlink_status(next, ec))) matches_.insert(next);
            } else if (fs::is_directory(next, ec)) {
                expand(next, idx + 1);
            }
            return;
        }

        if (!allowed(base)) return;
        fs::directory_iterator it(base, fs::directory_options::skip_permission_denied, ec);
        for (; !ec && it != fs::directory_iterator(); it.increment(ec)) {
            std::string name = it->path().filename().string();
            if (!std::regex_match(name, regexes_[idx])) continue;
            if (last) {
                matches_.insert(it->path());
            } else if (it->is_directory(ec)) {
                expand(it->path(), idx + 1);
            }
        }
    }

    std::vector<fs::path> results() const {
        return std::vector<fs::path>(matches_.begin(), matches_.end());
    }

private:
    bool allowed(const fs::path& dir) const { return !may_enter_ || may_enter_(dir); }

    std::vector<std::string> components_;
    const DirectoryFilter& may_enter_;
    std::vector<std::regex> regexes_;
    std::set<fs::path> matches_;
};

} // namespace

std::vector<fs::path> expand_glob(const std::string& absolute_pattern, const DirectoryFilter& may_enter) {
    if (absolute_pattern.empty() || absolute_pattern.front() != '/') {
        throw ArgumentError("Glob pattern must be absolute after resolution: " + absolute_pattern);
    }

    std::vector<std::string> components;
    size_t start = 1;
    while (start <= absolute_pattern.size()) {
        size_t end = absolute_pattern.find('/', start);
        if (end == std::string::npos) end = absolute_pattern.size();
        components.push_back(absolute_pattern.substr(start, end - start));
        start = end + 1;
    }
    // "dir/" means the directory itself
    while (!components.empty() && components.back().empty()) {
        components.pop_back();
    }

    GlobWalker walker(std::move(components), may_enter);
    walker.expand(fs::path("/"), 0);
    return walker.results();
}

} // namespace tmpltool
