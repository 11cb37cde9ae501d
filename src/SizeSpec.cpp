#include "SizeSpec.hpp"
#include <iomanip>
#include <limits>
#include <regex>
#include <sstream>
#include <stdexcept>
#include "SplitErrors.hpp"

std::uint64_t parse_size(const std::string& text) {
    static const std::regex pattern("^(\\d+)([Kk]|M)[Bb]?$");
    std::smatch match;
    if (!std::regex_match(text, match, pattern)) {
        throw ConfigurationError("Cannot understand size specification " + text);
    }

    std::uint64_t unit = match[2].str() == "M" ? 1024 * 1024 : 1024;
    std::uint64_t value = 0;
    try {
        value = std::stoull(match[1].str());
    } catch (const std::out_of_range&) {
        throw ConfigurationError("Cannot understand size specification " + text);
    }
    if (value > std::numeric_limits<std::uint64_t>::max() / unit) {
        throw ConfigurationError("Cannot understand size specification " + text);
    }
    return value * unit;
}

std::string format_size(std::uint64_t bytes) {
    double kb = static_cast<double>(bytes) / 1024.0;
    std::ostringstream oss;
    oss << std::fixed;
    if (kb >= 1024.0) {
        oss << std::setprecision(1) << kb / 1024.0 << " MB";
    } else {
        oss << std::setprecision(0) << kb << " KB";
    }
    return oss.str();
}
