#pragma once
#include <cstddef>
#include <optional>
#include <string>

// Hard ceiling for one request body's user turn, below the scanner's max file size.
constexpr std::size_t kMaxRemoteContentBytes = 512 * 1024;

// Share of non-text characters (per mille) at which content is refused.
constexpr std::size_t kNonTextPermille = 50;

// Returns the rejection reason, or nullopt when content may be sent.
// Checks run in order: empty, size, NUL byte, non-text ratio.
std::optional<std::string> validate_content(const std::string& content);
