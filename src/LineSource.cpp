#include "LineSource.hpp"
#include "LineUtils.hpp"
#include "MemorySegment.hpp"
#include "SplitErrors.hpp"

StreamLineSource::StreamLineSource(std::istream& in) : in_(in), pos_(0) {}

// std::getline only knows '\n'; a lone '\r' inside the pending text is split off afterwards.
bool StreamLineSource::next(std::string& line) {
    if (pos_ >= pending_.size()) {
        pending_.clear();
        pos_ = 0;
        if (!std::getline(in_, pending_)) {
            if (in_.bad()) {
                throw InputError("Read error on input stream");
            }
            line.clear();
            return false;
        }
        if (!in_.eof()) {
            pending_.push_back('\n');
        }
    }
    size_t end = find_line_end(pending_.data(), pending_.size(), pos_);
    line.assign(pending_, pos_, end - pos_);
    pos_ = end;
    return true;
}

BufferLineSource::BufferLineSource(const char* data, size_t size)
    : data_(data), size_(size), pos_(0) {}

BufferLineSource::BufferLineSource(const MemorySegment& segment)
    : BufferLineSource(segment.data(), segment.size()) {}

bool BufferLineSource::next(std::string& line) {
    if (pos_ >= size_) {
        line.clear();
        return false;
    }
    size_t end = find_line_end(data_, size_, pos_);
    line.assign(data_ + pos_, end - pos_);
    pos_ = end;
    return true;
}
