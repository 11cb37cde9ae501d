#pragma once
#include <cstddef>
#include <string_view>

// Returns the index one past the end of the line starting at 'pos', terminator included.
// Terminators are \n, \r\n and a lone \r. Returns total_size for a final unterminated line.
size_t find_line_end(const char* data, size_t total_size, size_t pos);

// Line content without its trailing terminator.
std::string_view strip_line_terminator(std::string_view line);

// Trailing terminator of the line ("\r\n", "\n", "\r" or empty).
std::string_view line_terminator(std::string_view line);

// True if the line begins with 'marker' at column 0 (no leading whitespace allowed).
bool line_starts_with(std::string_view line, std::string_view marker);
