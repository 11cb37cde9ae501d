#include "SplitReport.hpp"
#include "SizeSpec.hpp"

void print_summary(std::ostream& out, const std::string& prefix,
                   const std::vector<ChunkDescriptor>& chunks, bool dryRun) {
    size_t count = chunks.size();
    out << (dryRun ? "Would split" : "Split") << " into " << count
        << " file" << (count != 1 ? "s" : "") << ":" << std::endl;
    for (const auto& chunk : chunks) {
        out << "  " << part_file_name(prefix, chunk.index)
            << " (" << format_size(chunk.sizeBytes) << ", " << chunk.eventCount
            << " event" << (chunk.eventCount != 1 ? "s" : "") << ")" << std::endl;
    }
}

Json::Value report_to_json(const std::string& prefix, const std::vector<ChunkDescriptor>& chunks, bool dryRun) {
    Json::Value report;
    report["dry_run"] = dryRun;
    report["count"] = (Json::UInt64)chunks.size();
    report["files"] = Json::Value(Json::arrayValue);
    for (const auto& chunk : chunks) {
        Json::Value file;
        file["index"] = (Json::UInt64)chunk.index;
        file["filename"] = part_file_name(prefix, chunk.index);
        file["size"] = (Json::UInt64)chunk.sizeBytes;
        file["events"] = (Json::UInt64)chunk.eventCount;
        report["files"].append(file);
    }
    return report;
}
