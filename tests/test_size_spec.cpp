#include <iostream>
#include <string>
#include "../src/SizeSpec.hpp"
#include "../src/SplitErrors.hpp"

#define ASSERT_TRUE(cond) if(!(cond)) { std::cerr << "Assertion failed: " << #cond << " at " << __FILE__ << ":" << __LINE__ << std::endl; return 1; }

static bool rejects(const std::string& text) {
    try {
        parse_size(text);
    } catch (const ConfigurationError& e) {
        return std::string(e.what()) == "Cannot understand size specification " + text;
    }
    return false;
}

int main() {
    try {
        const std::uint64_t K = 1024;
        const std::uint64_t M = 1024 * 1024;

        // Valid specifications
        ASSERT_TRUE(parse_size("1M") == M);
        ASSERT_TRUE(parse_size("1MB") == M);
        ASSERT_TRUE(parse_size("1Mb") == M);
        ASSERT_TRUE(parse_size("1K") == K);
        ASSERT_TRUE(parse_size("1k") == K);
        ASSERT_TRUE(parse_size("1KB") == K);
        ASSERT_TRUE(parse_size("1kb") == K);
        ASSERT_TRUE(parse_size("5M") == 5 * M);
        ASSERT_TRUE(parse_size("500K") == 500 * K);
        ASSERT_TRUE(parse_size("100M") == 100 * M);
        ASSERT_TRUE(parse_size("0M") == 0);
        ASSERT_TRUE(parse_size("0K") == 0);

        // Invalid specifications
        ASSERT_TRUE(rejects("1G"));
        ASSERT_TRUE(rejects("1024"));
        ASSERT_TRUE(rejects("hello"));
        ASSERT_TRUE(rejects(""));
        ASSERT_TRUE(rejects("-1M"));
        ASSERT_TRUE(rejects("1.5M"));
        ASSERT_TRUE(rejects("1 M"));
        ASSERT_TRUE(rejects("1m"));
        ASSERT_TRUE(rejects("M"));
        ASSERT_TRUE(rejects("99999999999999999999999M"));
        ASSERT_TRUE(rejects("18014398509481984M"));

        // Human readable sizes
        ASSERT_TRUE(format_size(0) == "0 KB");
        ASSERT_TRUE(format_size(300) == "0 KB");
        ASSERT_TRUE(format_size(1600) == "2 KB");
        ASSERT_TRUE(format_size(500 * K) == "500 KB");
        ASSERT_TRUE(format_size(M - 1) == "1024 KB");
        ASSERT_TRUE(format_size(M) == "1.0 MB");
        ASSERT_TRUE(format_size(M + M / 2) == "1.5 MB");

    } catch (const std::exception& e) {
        std::cerr << "Exception: " << e.what() << std::endl;
        return 1;
    }
    std::cout << "All size spec tests passed" << std::endl;
    return 0;
}
