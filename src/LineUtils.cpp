#include "LineUtils.hpp"
#include <cstddef>

size_t find_line_end(const char* data, size_t total_size, size_t pos) {
	// advance to the first terminator character
	while (pos < total_size && data[pos] != '\n' && data[pos] != '\r') ++pos;
	if (pos >= total_size) {
		return total_size;
	}
	char ch = data[pos++];
	// \r\n counts as a single terminator; \n\r is two line breaks
	if (ch == '\r' && pos < total_size && data[pos] == '\n') {
		++pos;
	}
	return pos;
}

std::string_view strip_line_terminator(std::string_view line) {
	while (!line.empty() && (line.back() == '\n' || line.back() == '\r')) {
		line.remove_suffix(1);
	}
	return line;
}

std::string_view line_terminator(std::string_view line) {
	return line.substr(strip_line_terminator(line).size());
}

bool line_starts_with(std::string_view line, std::string_view marker) {
	return line.size() >= marker.size() && line.compare(0, marker.size(), marker) == 0;
}
