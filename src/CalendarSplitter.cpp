#include "CalendarSplitter.hpp"
#include <string_view>
#include <utility>
#include "LineUtils.hpp"
#include "SplitErrors.hpp"

namespace {

constexpr std::string_view kBeginCalendar = "BEGIN:VCALENDAR";
constexpr std::string_view kEndCalendar = "END:VCALENDAR";
constexpr std::string_view kBeginEvent = "BEGIN:VEVENT";
constexpr std::string_view kEndEvent = "END:VEVENT";
constexpr std::string_view kUtf8Bom = "\xEF\xBB\xBF";

bool is_calendar_begin(std::string_view line) {
    if (line_starts_with(line, kUtf8Bom)) {
        line.remove_prefix(kUtf8Bom.size());
    }
    return strip_line_terminator(line) == kBeginCalendar;
}

}

CalendarSplitter::CalendarSplitter(SplitConfig config, ChunkSink& sink, TextEncoding encoding)
    : config_(config), sink_(sink), encoding_(std::move(encoding)) {}

std::vector<ChunkDescriptor> CalendarSplitter::split(LineSource& input) {
    header_.clear();
    headerSize_ = 0;
    content_.clear();
    currentSize_ = 0;
    eventCount_ = 0;
    descriptors_.clear();

    std::string line;
    if (!input.next(line)) {
        throw InvalidFormatError("Input is empty; expected " + std::string(kBeginCalendar));
    }
    if (!is_calendar_begin(line)) {
        throw InvalidFormatError("Input does not begin with " + std::string(kBeginCalendar));
    }

    // Other charsets cannot carry a UTF-8 byte order mark.
    if (!encoding_.isUtf8() && line_starts_with(line, kUtf8Bom)) {
        line.erase(0, kUtf8Bom.size());
    }

    std::string_view terminator = line_terminator(line);
    endMarker_ = std::string(kEndCalendar) + std::string(terminator.empty() ? "\r\n" : terminator);

    bool headerCaptured = false;
    do {
        if (!headerCaptured) {
            if (line_starts_with(line, kBeginEvent)) {
                headerCaptured = true;
                headerSize_ = currentSize_;
            } else {
                header_ += line;
                appendLine(line);
                continue;
            }
        }

        appendLine(line);
        if (line_starts_with(line, kEndEvent)) {
            ++eventCount_;
            if (rolloverDue()) {
                if (line_terminator(line).empty()) {
                    // Unterminated last line: the marker still needs a line of its own.
                    content_.append(endMarker_, kEndCalendar.size(), std::string::npos);
                }
                content_ += endMarker_;
                deliverChunk();
                openChunk();
            }
        }
    } while (input.next(line));

    // The source's own END:VCALENDAR has already been copied into the last chunk.
    deliverChunk();
    return descriptors_;
}

void CalendarSplitter::appendLine(const std::string& line) {
    content_ += line;
    currentSize_ += encoding_.encodedLength(line);
}

bool CalendarSplitter::rolloverDue() const {
    if (currentSize_ > config_.maxBytes) {
        return true;
    }
    return config_.maxEvents && eventCount_ >= *config_.maxEvents;
}

void CalendarSplitter::deliverChunk() {
    ChunkDescriptor descriptor;
    descriptor.index = descriptors_.size() + 1;
    descriptor.sizeBytes = encoding_.encodedLength(content_);
    descriptor.eventCount = eventCount_;
    sink_.deliver(content_, descriptor);
    descriptors_.push_back(descriptor);
}

void CalendarSplitter::openChunk() {
    content_ = header_;
    currentSize_ = headerSize_;
    eventCount_ = 0;
}
