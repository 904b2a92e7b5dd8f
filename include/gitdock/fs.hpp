#pragma once
#include <cstdint>
#include <filesystem>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace gitdock::fs {

bool exists(const std::filesystem::path& p);
void ensure_parent_dir(const std::filesystem::path& p);

std::vector<std::uint8_t> read_file(const std::filesystem::path& p);

// Write to a uniquely named sibling temp file, then rename over `p`.
// Safe when several threads write the same path concurrently.
void write_file_atomic(const std::filesystem::path& p, std::span<const std::uint8_t> data);
void write_file_atomic(const std::filesystem::path& p, std::string_view text);

// Create an empty directory with a unique name "<prefix>XXXXXX" under `parent`.
std::filesystem::path make_temp_dir(const std::filesystem::path& parent, std::string_view prefix);

std::vector<std::uint8_t> z_compress(std::span<const std::uint8_t> data);
// Throws once the output would grow past `limit` bytes.
std::vector<std::uint8_t> z_decompress(std::span<const std::uint8_t> data,
                                       std::size_t limit = SIZE_MAX);

} // namespace gitdock::fs
