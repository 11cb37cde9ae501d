#pragma once
#include <ostream>
#include <string>
#include <vector>
#include <json/json.h>
#include "ChunkSink.hpp"

// "Split into 2 files:" followed by one "  name (size, n events)" line per chunk.
void print_summary(std::ostream& out, const std::string& prefix,
                   const std::vector<ChunkDescriptor>& chunks, bool dryRun);

Json::Value report_to_json(const std::string& prefix, const std::vector<ChunkDescriptor>& chunks, bool dryRun);
