#include <iostream>
#include <optional>
#include <random>
#include <string>
#include <string_view>
#include <vector>
#include "../src/CalendarSplitter.hpp"
#include "../src/ChunkSink.hpp"
#include "../src/LineSource.hpp"
#include "../src/LineUtils.hpp"

#define ASSERT_TRUE(cond) if(!(cond)) { std::cerr << "Assertion failed: " << #cond << " at " << __FILE__ << ":" << __LINE__ << std::endl; return 1; }

struct Calendar {
    std::string header;
    std::vector<std::string> eventLines;
    std::string text;
};

// Random calendar: variable header length, events with variable property counts and lengths
static Calendar random_calendar(std::mt19937& rng, const std::string& nl) {
    std::uniform_int_distribution<int> headerLines_d(0, 6);
    std::uniform_int_distribution<int> events_d(0, 40);
    std::uniform_int_distribution<int> props_d(1, 8);
    std::uniform_int_distribution<int> len_d(0, 120);

    Calendar cal;
    cal.header = "BEGIN:VCALENDAR" + nl + "VERSION:2.0" + nl;
    int headerLines = headerLines_d(rng);
    for (int i = 0; i < headerLines; ++i) {
        cal.header += "X-HEADER-" + std::to_string(i) + ":" + std::string(len_d(rng), 'h') + nl;
    }
    int events = events_d(rng);
    for (int e = 0; e < events; ++e) {
        cal.eventLines.push_back("BEGIN:VEVENT" + nl);
        cal.eventLines.push_back("UID:" + std::to_string(e) + "@props" + nl);
        int props = props_d(rng);
        for (int p = 0; p < props; ++p) {
            cal.eventLines.push_back("DESCRIPTION:" + std::string(len_d(rng), 'd') + nl);
        }
        cal.eventLines.push_back("END:VEVENT" + nl);
    }
    cal.text = cal.header;
    for (const auto& line : cal.eventLines) cal.text += line;
    cal.text += "END:VCALENDAR" + nl;
    return cal;
}

static std::vector<std::string> split_lines(const std::string& s) {
    std::vector<std::string> lines;
    BufferLineSource source(s.data(), s.size());
    std::string line;
    while (source.next(line)) lines.push_back(line);
    return lines;
}

int main() {
    try {
        std::mt19937 rng(20240101);
        std::uniform_int_distribution<int> bytes_d(0, 4096);
        std::uniform_int_distribution<int> count_d(0, 6);

        for (int iter = 0; iter < 500; ++iter) {
            std::string nl = (iter % 2 == 0) ? "\n" : "\r\n";
            Calendar cal = random_calendar(rng, nl);

            SplitConfig config;
            config.maxBytes = static_cast<std::uint64_t>(bytes_d(rng));
            int count = count_d(rng);
            if (count > 0) config.maxEvents = static_cast<size_t>(count);

            MemoryChunkSink sink;
            CalendarSplitter splitter(config, sink);
            BufferLineSource source(cal.text.data(), cal.text.size());
            auto chunks = splitter.split(source);

            // Header capture does not depend on the limits
            ASSERT_TRUE(splitter.header() == (cal.eventLines.empty() ? cal.text : cal.header));
            ASSERT_TRUE(!chunks.empty());
            ASSERT_TRUE(chunks.size() == sink.chunks().size());

            std::vector<std::string> collectedEvents;
            size_t totalEvents = 0;
            for (size_t i = 0; i < chunks.size(); ++i) {
                const std::string& content = sink.chunks()[i].content;
                ASSERT_TRUE(chunks[i].index == i + 1);
                ASSERT_TRUE(chunks[i].sizeBytes == content.size());
                // Every chunk starts with the header and ends with an end marker line
                ASSERT_TRUE(content.compare(0, splitter.header().size(), splitter.header()) == 0);
                ASSERT_TRUE(strip_line_terminator(content).size() >= 13);
                std::string_view body = strip_line_terminator(content);
                ASSERT_TRUE(body.substr(body.size() - 13) == "END:VCALENDAR");
                if (config.maxEvents) {
                    ASSERT_TRUE(chunks[i].eventCount <= *config.maxEvents);
                }
                totalEvents += chunks[i].eventCount;

                if (cal.eventLines.empty()) continue;
                auto lines = split_lines(content.substr(cal.header.size()));
                ASSERT_TRUE(!lines.empty());
                lines.pop_back(); // synthesized or original END:VCALENDAR
                for (const auto& line : lines) collectedEvents.push_back(line);
            }

            // Event lines come through exactly once, in order
            ASSERT_TRUE(collectedEvents == cal.eventLines);
            size_t expectedEvents = 0;
            for (const auto& line : cal.eventLines) {
                if (line_starts_with(line, "END:VEVENT")) ++expectedEvents;
            }
            ASSERT_TRUE(totalEvents == expectedEvents);

            // Same header when re-split with other limits
            SplitConfig other;
            other.maxBytes = 1024 * 1024;
            MemoryChunkSink otherSink;
            CalendarSplitter otherSplitter(other, otherSink);
            BufferLineSource again(cal.text.data(), cal.text.size());
            auto single = otherSplitter.split(again);
            ASSERT_TRUE(otherSplitter.header() == splitter.header());
            ASSERT_TRUE(single.size() == 1);
            ASSERT_TRUE(otherSink.chunks()[0].content == cal.text);
        }

    } catch (const std::exception& e) {
        std::cerr << "Exception: " << e.what() << std::endl;
        return 1;
    }
    std::cout << "All split property tests passed" << std::endl;
    return 0;
}
