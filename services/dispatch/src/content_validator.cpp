#include "../include/content_validator.hpp"

namespace {
bool is_text_byte(unsigned char c) {
    return (c >= 0x20 && c < 0x7f) || c == '\t' || c == '\n' || c == '\r';
}

// Continuation bytes expected after a lead byte; 0 for anything that cannot start a sequence.
std::size_t utf8_trailing(unsigned char c) {
    if (c >= 0xC2 && c <= 0xDF) return 1;
    if (c >= 0xE0 && c <= 0xEF) return 2;
    if (c >= 0xF0 && c <= 0xF4) return 3;
    return 0;
}

bool is_space(unsigned char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\v' || c == '\f';
}
}

std::optional<std::string> validate_content(const std::string& content) {
    bool blank = true;
    for (unsigned char c : content) {
        if (!is_space(c)) { blank = false; break; }
    }
    if (blank) return std::string("empty content");

    if (content.size() > kMaxRemoteContentBytes) return std::string("too large for remote call");

    if (content.find('\0') != std::string::npos) return std::string("binary content");

    // Characters, not bytes: a well-formed UTF-8 sequence is one character.
    // Continuation bytes outside a sequence each count as one non-text character.
    std::size_t chars = 0;
    std::size_t non_text = 0;
    std::size_t trailing = 0;
    for (unsigned char c : content) {
        if (trailing > 0 && (c & 0xC0) == 0x80) {
            --trailing;
            continue;
        }
        trailing = 0;
        ++chars;
        if (is_text_byte(c)) continue;
        ++non_text;
        trailing = utf8_trailing(c);
    }
    if (non_text * 1000 >= chars * kNonTextPermille) return std::string("non-text content");

    return std::nullopt;
}
