#ifndef TMPLTOOL_COMMON_UTILS_TOML_JSON_H
#define TMPLTOOL_COMMON_UTILS_TOML_JSON_H

#include "tmpltool/common/types.h"
#include <toml++/toml.hpp>
#include <string>
#include <string_view>

namespace tmpltool {

// toml::node -> JSON value. Dates, times and date-times become their TOML
// text form. Throws std::invalid_argument for inf/nan floats.
Value toml_to_json(const toml::node& node);

// Parses a TOML document into a JSON object; throws toml::parse_error on
// bad input. `source` names the document in parser messages.
Value parse_toml_document(std::string_view text, const std::string& source);

} // namespace tmpltool

#endif // TMPLTOOL_COMMON_UTILS_TOML_JSON_H
