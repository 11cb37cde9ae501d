#pragma once
#include <cstddef>
#include <optional>
#include <string>
#include <json/json.h>
#include "CalendarSplitter.hpp"

// Everything the front ends collect before running a split.
struct SplitOptions {
    std::string inputPath;              // "-" reads standard input
    std::string size = "1M";
    std::optional<size_t> maxEvents;
    std::string encoding = "utf-8";
    std::string outputDir;              // empty: directory of the input file
    std::string outputPrefix;           // empty: derived from the input file name
    bool dryRun = false;
    bool overwrite = false;
    bool quiet = false;
    bool json = false;
    bool verbose = false;
};

// Values given on the command line. Set values win over the config file;
// the switches can only turn a setting on.
struct CommandLine {
    std::optional<std::string> configPath;
    std::optional<std::string> size;
    std::optional<std::string> number;
    std::optional<std::string> encoding;
    std::optional<std::string> outputPrefix;
    std::optional<std::string> outputDir;
    bool quiet = false;
    bool json = false;
    bool verbose = false;
    bool dryRun = false;
    bool overwrite = false;
    std::string input;
};

// Positive decimal integer, otherwise ConfigurationError.
size_t parse_event_limit(const std::string& text);

// Applies the keys of a "split" config object onto 'options'. 'origin' names the source in errors.
void apply_options_json(const Json::Value& section, SplitOptions& options, const std::string& origin);

// Reads a JSON config file and applies its "split" section. Throws ConfigurationError.
void load_options_file(const std::string& path, SplitOptions& options);

// Merges 'cli' over 'options' (already holding any config file values).
// Throws ConfigurationError for a bad -n value.
void apply_command_line(const CommandLine& cli, SplitOptions& options);

// Fills outputDir and outputPrefix from the input path when they were not given.
void resolve_output_paths(SplitOptions& options);

// Throws ConfigurationError for a bad size string.
SplitConfig make_split_config(const SplitOptions& options);
