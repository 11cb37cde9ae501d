#include "ChunkSink.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <system_error>
#include <utility>
#include "SplitErrors.hpp"

std::string part_file_name(const std::string& prefix, size_t index) {
    return prefix + "_part" + std::to_string(index) + ".ics";
}

std::string default_output_prefix(const std::string& inputPath) {
    std::string base = std::filesystem::path(inputPath).filename().string();
    if (base.size() >= 4) {
        std::string suffix = base.substr(base.size() - 4);
        std::transform(suffix.begin(), suffix.end(), suffix.begin(), [](unsigned char c) {
            return static_cast<char>(std::tolower(c));
        });
        if (suffix == ".ics") {
            base.resize(base.size() - 4);
        }
    }
    return base;
}

FileChunkSink::FileChunkSink(std::filesystem::path outputDir, std::string prefix, TextEncoding encoding, bool overwrite)
    : outputDir_(std::move(outputDir)),
      prefix_(std::move(prefix)),
      encoding_(std::move(encoding)),
      overwrite_(overwrite) {}

void FileChunkSink::deliver(const std::string& content, const ChunkDescriptor& descriptor) {
    auto target = outputDir_ / part_file_name(prefix_, descriptor.index);

    std::error_code ec;
    bool exists = std::filesystem::exists(target, ec);
    if (ec) {
        throw WriteIOError("Cannot inspect output file: " + target.string() + ": " + ec.message());
    }
    if (exists && !overwrite_) {
        throw WriteConflictError("Output file already exists: " + target.string() +
                                 "\nUse --overwrite to replace existing files.");
    }

    std::string bytes = encoding_.encode(content);
    std::ofstream ofs(target, std::ios::binary | std::ios::trunc);
    if (!ofs) {
        throw WriteIOError("Cannot open output file: " + target.string());
    }
    ofs.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
    ofs.close();
    if (!ofs) {
        throw WriteIOError("Failed to write output file: " + target.string());
    }
    written_.push_back(target);
}

DryRunChunkSink::DryRunChunkSink(std::string prefix) : prefix_(std::move(prefix)) {}

void DryRunChunkSink::deliver(const std::string&, const ChunkDescriptor& descriptor) {
    planned_.push_back(part_file_name(prefix_, descriptor.index));
}

void MemoryChunkSink::deliver(const std::string& content, const ChunkDescriptor& descriptor) {
    chunks_.push_back({content, descriptor});
}

LoggingChunkSink::LoggingChunkSink(ChunkSink& inner, std::ostream& log, std::string prefix)
    : inner_(inner), log_(log), prefix_(std::move(prefix)) {}

void LoggingChunkSink::deliver(const std::string& content, const ChunkDescriptor& descriptor) {
    inner_.deliver(content, descriptor);
    log_ << "Delivered " << part_file_name(prefix_, descriptor.index)
         << " (" << descriptor.sizeBytes << " bytes, " << descriptor.eventCount << " events)" << std::endl;
}
