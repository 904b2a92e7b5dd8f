#pragma once
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace gitdock::diff {

inline constexpr std::size_t kDefaultContext = 3;

// Unified diff of two line sequences: "--- a/<path>", "+++ b/<path>", then
// hunks with `context` unchanged lines around each change. Empty when the
// sequences are equal.
std::string unified_diff(const std::vector<std::string>& a,
                         const std::vector<std::string>& b,
                         std::string_view path,
                         std::size_t context = kDefaultContext);

// Split raw text into lines (newlines trimmed, '\r' dropped).
std::vector<std::string> split_lines(std::string_view text);

// git's heuristic: a NUL byte in the first 8000 bytes.
bool looks_binary(std::string_view content);

} // namespace gitdock::diff
