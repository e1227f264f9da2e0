// common/utils/text.cpp
#include "common/utils/text.h"
#include <cctype>

namespace tmpltool {

namespace {

// Length of the valid UTF-8 sequence starting at `i`, or 0 if invalid
size_t utf8_sequence_length(std::string_view s, size_t i) {
    const auto byte = [&](size_t k) { return static_cast<unsigned char>(s[k]); };
    unsigned char c = byte(i);
    if (c < 0x80) return 1;

    size_t len = 0;
    unsigned char lo = 0x80, hi = 0xBF;
    if (c >= 0xC2 && c <= 0xDF) {
        len = 2;
    } else if (c == 0xE0) {
        len = 3; lo = 0xA0;
    } else if ((c >= 0xE1 && c <= 0xEC) || c == 0xEE || c == 0xEF) {
        len = 3;
    } else if (c == 0xED) {
        len = 3; hi = 0x9F; // no surrogates
    } else if (c == 0xF0) {
        len = 4; lo = 0x90;
    } else if (c >= 0xF1 && c <= 0xF3) {
        len = 4;
    } else if (c == 0xF4) {
        len = 4; hi = 0x8F;
    } else {
        return 0;
    }

    if (i + len > s.size()) return 0;
    if (byte(i + 1) < lo || byte(i + 1) > hi) return 0;
    for (size_t k = 2; k < len; ++k) {
        if (byte(i + k) < 0x80 || byte(i + k) > 0xBF) return 0;
    }
    return len;
}

bool is_identifier_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

} // namespace

bool is_valid_utf8(std::string_view bytes) {
    size_t i = 0;
    while (i < bytes.size()) {
        size_t len = utf8_sequence_length(bytes, i);
        if (len == 0) return false;
        i += len;
    }
    return true;
}

std::string sanitize_utf8(std::string_view bytes) {
    static const char kReplacement[] = "\xEF\xBF\xBD";
    std::string out;
    out.reserve(bytes.size());
    size_t i = 0;
    while (i < bytes.size()) {
        size_t len = utf8_sequence_length(bytes, i);
        if (len == 0) {
            out += kReplacement;
            ++i;
        } else {
            out.append(bytes.data() + i, len);
            i += len;
        }
    }
    return out;
}

std::vector<std::string> split_lines(std::string_view text) {
    std::vector<std::string> lines;
    size_t start = 0;
    while (start < text.size()) {
        size_t end = text.find('\n', start);
        if (end == std::string_view::npos) end = text.size();
        std::string_view line = text.substr(start, end - start);
        if (!line.empty() && line.back() == '\r') {
            line.remove_suffix(1);
        }
        lines.emplace_back(line);
        start = end + 1;
    }
    return lines;
}

std::optional<SourceLocation> find_call_site(std::string_view source, std::string_view name) {
    if (name.empty()) return std::nullopt;

    size_t pos = source.find(name);
    while (pos != std::string_view::npos) {
        bool starts_word = pos == 0 || !is_identifier_char(source[pos - 1]);
        size_t after = pos + name.size();
        while (after < source.size() && (source[after] == ' ' || source[after] == '\t')) {
            ++after;
        }
        if (starts_word && after < source.size() && source[after] == '(') {
            SourceLocation loc;
            loc.line = 1;
            size_t line_start = 0;
            for (size_t i = 0; i < pos; ++i) {
                if (source[i] == '\n') {
                    ++loc.line;
                    line_start = i + 1;
                }
            }
            loc.column = pos - line_start + 1;
            return loc;
        }
        pos = source.find(name, pos + 1);
    }
    return std::nullopt;
}

} // namespace tmpltool
