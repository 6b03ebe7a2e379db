#pragma once
#include <string>
#include <cstdint>
#include <optional>

namespace substrate {

// Unix epoch seconds
uint64_t epoch_seconds();

// ASCII lowercase copy
std::string to_lower(const std::string& s);

// Trim whitespace
std::string trim(const std::string& s);

// Expand ~ to home directory
std::string expand_home(const std::string& path);

// Strict numeric parsing: the whole (trimmed) string must be consumed.
std::optional<uint32_t> parse_uint(const std::string& s);
std::optional<double> parse_double(const std::string& s);

} // namespace substrate
