#pragma once
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <ostream>
#include <string>
#include <vector>
#include "TextEncoding.hpp"

// Report record of one finalized chunk.
struct ChunkDescriptor {
    size_t index = 0;            // 1-based sequence number
    std::uint64_t sizeBytes = 0; // length in the output encoding
    size_t eventCount = 0;
};

// Receives each finalized chunk before the splitter starts the next one.
// Implementations report failures with WriteConflictError or WriteIOError.
class ChunkSink {
public:
    virtual ~ChunkSink() = default;
    virtual void deliver(const std::string& content, const ChunkDescriptor& descriptor) = 0;
};

// "{prefix}_part{index}.ics"
std::string part_file_name(const std::string& prefix, size_t index);

// Input file name without directory and without a trailing ".ics" (any case).
std::string default_output_prefix(const std::string& inputPath);

class FileChunkSink : public ChunkSink {
public:
    FileChunkSink(std::filesystem::path outputDir, std::string prefix, TextEncoding encoding, bool overwrite);

    void deliver(const std::string& content, const ChunkDescriptor& descriptor) override;

    const std::vector<std::filesystem::path>& writtenFiles() const { return written_; }

private:
    std::filesystem::path outputDir_;
    std::string prefix_;
    TextEncoding encoding_;
    bool overwrite_;
    std::vector<std::filesystem::path> written_;
};

// Never touches storage; remembers the names that would have been written.
class DryRunChunkSink : public ChunkSink {
public:
    explicit DryRunChunkSink(std::string prefix);

    void deliver(const std::string& content, const ChunkDescriptor& descriptor) override;

    const std::vector<std::string>& plannedFiles() const { return planned_; }

private:
    std::string prefix_;
    std::vector<std::string> planned_;
};

struct CollectedChunk {
    std::string content;
    ChunkDescriptor descriptor;
};

class MemoryChunkSink : public ChunkSink {
public:
    void deliver(const std::string& content, const ChunkDescriptor& descriptor) override;

    const std::vector<CollectedChunk>& chunks() const { return chunks_; }

private:
    std::vector<CollectedChunk> chunks_;
};

// Forwards to another sink and logs one line per delivered chunk.
class LoggingChunkSink : public ChunkSink {
public:
    LoggingChunkSink(ChunkSink& inner, std::ostream& log, std::string prefix);

    void deliver(const std::string& content, const ChunkDescriptor& descriptor) override;

private:
    ChunkSink& inner_;
    std::ostream& log_;
    std::string prefix_;
};
