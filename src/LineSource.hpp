#pragma once
#include <cstddef>
#include <istream>
#include <string>

class MemorySegment;

// Sequential reader of calendar lines. Each line keeps its original terminator.
class LineSource {
public:
    virtual ~LineSource() = default;

    // Replaces 'line' with the next line. Returns false once the input is exhausted.
    virtual bool next(std::string& line) = 0;
};

class StreamLineSource : public LineSource {
public:
    explicit StreamLineSource(std::istream& in);

    bool next(std::string& line) override;

private:
    std::istream& in_;
    std::string pending_; // last physical '\n' line, not yet fully handed out
    size_t pos_;
};

// Walks a byte range owned by the caller (a mapped file or a request body).
class BufferLineSource : public LineSource {
public:
    BufferLineSource(const char* data, size_t size);
    explicit BufferLineSource(const MemorySegment& segment);

    bool next(std::string& line) override;

private:
    const char* data_;
    size_t size_;
    size_t pos_;
};
