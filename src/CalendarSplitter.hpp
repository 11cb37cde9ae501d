#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "ChunkSink.hpp"
#include "LineSource.hpp"
#include "TextEncoding.hpp"

struct SplitConfig {
    std::uint64_t maxBytes = 0;
    std::optional<size_t> maxEvents; // nullopt: no event limit
};

// Streaming ICS splitter.
//
// Lines before the first BEGIN:VEVENT form the calendar header, which is replayed at the
// top of every chunk. After each END:VEVENT the active chunk rolls over when its encoded
// size exceeds maxBytes or its event count reaches maxEvents; a rolled-over chunk gets a
// synthesized END:VCALENDAR line. The chunk open at end of input is delivered as is.
class CalendarSplitter {
public:
    CalendarSplitter(SplitConfig config, ChunkSink& sink, TextEncoding encoding = TextEncoding());

    // Throws InvalidFormatError before any delivery if the first line is not BEGIN:VCALENDAR.
    // Errors raised by the sink propagate unchanged; chunks already delivered stay delivered.
    std::vector<ChunkDescriptor> split(LineSource& input);

    // Header captured by the last split (empty before the first one).
    const std::string& header() const { return header_; }

private:
    void appendLine(const std::string& line);
    bool rolloverDue() const;
    void deliverChunk();
    void openChunk();

    SplitConfig config_;
    ChunkSink& sink_;
    TextEncoding encoding_;

    std::string header_;
    std::uint64_t headerSize_ = 0;
    std::string endMarker_;
    std::string content_;
    std::uint64_t currentSize_ = 0;
    size_t eventCount_ = 0;
    std::vector<ChunkDescriptor> descriptors_;
};
