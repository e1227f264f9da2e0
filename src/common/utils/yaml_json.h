#ifndef TMPLTOOL_COMMON_UTILS_YAML_JSON_H
#define TMPLTOOL_COMMON_UTILS_YAML_JSON_H

#include "tmpltool/common/types.h"
#include <yaml-cpp/yaml.h>
#include <string>

namespace tmpltool {

// YAML::Node -> JSON value. Plain scalars are typed (bool, null, integer,
// float); quoted scalars always stay strings.
Value yaml_to_json(const YAML::Node& node);

// Parses a YAML document into JSON; throws YAML::Exception on bad input
Value parse_yaml_document(const std::string& text);

// JSON -> YAML text (used for the --ide yaml catalog)
std::string json_to_yaml(const Value& value);

} // namespace tmpltool

#endif // TMPLTOOL_COMMON_UTILS_YAML_JSON_H
