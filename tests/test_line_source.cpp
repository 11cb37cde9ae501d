#include <iostream>
#include <fstream>
#include <filesystem>
#include <sstream>
#include <string>
#include <vector>
#include "../src/LineSource.hpp"
#include "../src/MemorySegment.hpp"
#include "../src/SplitErrors.hpp"

#define ASSERT_TRUE(cond) if(!(cond)) { std::cerr << "Assertion failed: " << #cond << " at " << __FILE__ << ":" << __LINE__ << std::endl; return 1; }

static std::vector<std::string> drain(LineSource& source) {
    std::vector<std::string> lines;
    std::string line;
    while (source.next(line)) lines.push_back(line);
    return lines;
}

int main() {
    try {
        auto tmpDir = std::filesystem::temp_directory_path();
        auto tmpFile = tmpDir / "icssplit_line_source_test.ics";
        std::string content = "BEGIN:VCALENDAR\r\nVERSION:2.0\r\nEND:VCALENDAR";
        {
            std::ofstream ofs(tmpFile, std::ios::binary);
            ofs << content;
        }

        // Mapped file yields lines with terminators, last one unterminated
        {
            MemorySegment segment(tmpFile.string());
            ASSERT_TRUE(segment.size() == content.size());
            ASSERT_TRUE(std::string(segment.data(), segment.size()) == content);
            BufferLineSource source(segment);
            auto lines = drain(source);
            ASSERT_TRUE(lines.size() == 3);
            ASSERT_TRUE(lines[0] == "BEGIN:VCALENDAR\r\n");
            ASSERT_TRUE(lines[1] == "VERSION:2.0\r\n");
            ASSERT_TRUE(lines[2] == "END:VCALENDAR");
        }

        // Empty file maps to an empty segment
        auto emptyFile = tmpDir / "icssplit_line_source_empty.ics";
        {
            std::ofstream ofs(emptyFile, std::ios::binary);
        }
        {
            MemorySegment segment(emptyFile.string());
            ASSERT_TRUE(segment.size() == 0);
            BufferLineSource source(segment);
            std::string line = "stale";
            ASSERT_TRUE(!source.next(line));
            ASSERT_TRUE(line.empty());
        }

        // Missing file is an input error
        bool threw = false;
        try {
            MemorySegment segment((tmpDir / "icssplit_does_not_exist.ics").string());
        } catch (const InputError&) {
            threw = true;
        }
        ASSERT_TRUE(threw);

        // Stream source handles every terminator style
        std::istringstream iss("A\nB\r\nC\rD");
        StreamLineSource stream(iss);
        auto lines = drain(stream);
        ASSERT_TRUE(lines.size() == 4);
        ASSERT_TRUE(lines[0] == "A\n");
        ASSERT_TRUE(lines[1] == "B\r\n");
        ASSERT_TRUE(lines[2] == "C\r");
        ASSERT_TRUE(lines[3] == "D");

        // Several lone CRs on one physical line, blank lines, trailing CR
        {
            std::istringstream in("a\rb\rc\n\n\r\nx\r");
            StreamLineSource source(in);
            auto got = drain(source);
            std::vector<std::string> expected = {"a\r", "b\r", "c\n", "\n", "\r\n", "x\r"};
            ASSERT_TRUE(got == expected);
            std::string line = "stale";
            ASSERT_TRUE(!source.next(line));
            ASSERT_TRUE(line.empty());
        }

        // Empty stream
        {
            std::istringstream in("");
            StreamLineSource source(in);
            std::string line;
            ASSERT_TRUE(!source.next(line));
        }

        // A multi-megabyte stream reads the same as the buffer
        {
            std::string big;
            const char* terminators[] = {"\n", "\r\n", "\r"};
            for (int i = 0; big.size() < 4 * 1024 * 1024; ++i) {
                big += "DESCRIPTION:line " + std::to_string(i) + std::string(i % 97, 'x') + terminators[i % 3];
            }
            BufferLineSource buffer(big.data(), big.size());
            auto expected = drain(buffer);
            std::istringstream in(big);
            StreamLineSource source(in);
            auto got = drain(source);
            ASSERT_TRUE(got.size() == expected.size());
            ASSERT_TRUE(got == expected);
        }

        std::filesystem::remove(tmpFile);
        std::filesystem::remove(emptyFile);

    } catch (const std::exception& e) {
        std::cerr << "Exception: " << e.what() << std::endl;
        return 1;
    }
    std::cout << "All line source tests passed" << std::endl;
    return 0;
}
