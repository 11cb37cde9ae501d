#pragma once
#include <cstdint>
#include <string>

// Parses "500K", "1M", "1MB", "500kb": an integer followed by K/k (1024) or M (1048576)
// and an optional B/b. Throws ConfigurationError for anything else.
std::uint64_t parse_size(const std::string& text);

// "12 KB" below one megabyte, "1.5 MB" from there on.
std::string format_size(std::uint64_t bytes);
