#ifndef TMPLTOOL_COMMON_UTILS_TEXT_H
#define TMPLTOOL_COMMON_UTILS_TEXT_H

#include "tmpltool/core/errors.h"
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tmpltool {

bool is_valid_utf8(std::string_view bytes);

// Lossy decode: every invalid sequence becomes U+FFFD
std::string sanitize_utf8(std::string_view bytes);

// Splits on '\n', dropping one trailing '\r' per line and the empty piece after
// a final newline ("a\nb\n" -> {"a", "b"})
std::vector<std::string> split_lines(std::string_view text);

// Line/column (1-based) of the first call `name(` in a template source
std::optional<SourceLocation> find_call_site(std::string_view source, std::string_view name);

} // namespace tmpltool

#endif // TMPLTOOL_COMMON_UTILS_TEXT_H
