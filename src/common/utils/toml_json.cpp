// common/utils/toml_json.cpp
#include "common/utils/toml_json.h"
#include <cmath>
#include <sstream>
#include <stdexcept>

namespace tmpltool {

namespace {

template <typename T>
std::string to_text(const T& v) {
    std::ostringstream oss;
    oss << v;
    return oss.str();
}

} // namespace

Value toml_to_json(const toml::node& node) {
    if (const toml::table* tbl = node.as_table()) {
        Value obj = Value::object();
        for (auto&& [key, child] : *tbl) {
            obj[std::string(key.str())] = toml_to_json(child);
        }
        return obj;
    }
    if (const toml::array* arr = node.as_array()) {
        Value out = Value::array();
        for (const toml::node& child : *arr) {
            out.push_back(toml_to_json(child));
        }
        return out;
    }
    if (const auto* s = node.as_string()) return s->get();
    if (const auto* i = node.as_integer()) return static_cast<long long>(i->get());
    if (const auto* b = node.as_boolean()) return b->get();
    if (const auto* f = node.as_floating_point()) {
        double d = f->get();
        if (!std::isfinite(d)) {
            throw std::invalid_argument("float value " + to_text(d) + " has no JSON representation");
        }
        return d;
    }
    if (const auto* d = node.as_date()) return to_text(d->get());
    if (const auto* t = node.as_time()) return to_text(t->get());
    if (const auto* dt = node.as_date_time()) return to_text(dt->get());
    return nullptr;
}

Value parse_toml_document(std::string_view text, const std::string& source) {
    toml::table doc = toml::parse(text, source);
    return toml_to_json(doc);
}

} // namespace tmpltool
