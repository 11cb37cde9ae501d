#include "SplitOptions.hpp"
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include "ChunkSink.hpp"
#include "SizeSpec.hpp"
#include "SplitErrors.hpp"

size_t parse_event_limit(const std::string& text) {
    bool digits = !text.empty() && text.find_first_not_of("0123456789") == std::string::npos;
    unsigned long long value = 0;
    if (digits) {
        try {
            value = std::stoull(text);
        } catch (const std::out_of_range&) {
            digits = false;
        }
    }
    if (!digits || value == 0) {
        throw ConfigurationError("Event limit must be a positive integer: " + text);
    }
    return static_cast<size_t>(value);
}

namespace {

std::string string_value(const Json::Value& section, const char* key, const std::string& origin) {
    const Json::Value& v = section[key];
    if (!v.isString()) {
        throw ConfigurationError(std::string("Invalid value for split.") + key + " in " + origin + ": expected a string");
    }
    return v.asString();
}

bool bool_value(const Json::Value& section, const char* key, const std::string& origin) {
    const Json::Value& v = section[key];
    if (!v.isBool()) {
        throw ConfigurationError(std::string("Invalid value for split.") + key + " in " + origin + ": expected true or false");
    }
    return v.asBool();
}

}

void apply_options_json(const Json::Value& section, SplitOptions& options, const std::string& origin) {
    if (!section.isObject()) {
        throw ConfigurationError("Section 'split' in " + origin + " must be an object");
    }
    if (section.isMember("size")) options.size = string_value(section, "size", origin);
    if (section.isMember("encoding")) options.encoding = string_value(section, "encoding", origin);
    if (section.isMember("output_dir")) options.outputDir = string_value(section, "output_dir", origin);
    if (section.isMember("output_prefix")) options.outputPrefix = string_value(section, "output_prefix", origin);
    if (section.isMember("overwrite")) options.overwrite = bool_value(section, "overwrite", origin);
    if (section.isMember("dry_run")) options.dryRun = bool_value(section, "dry_run", origin);
    if (section.isMember("quiet")) options.quiet = bool_value(section, "quiet", origin);
    if (section.isMember("json")) options.json = bool_value(section, "json", origin);
    if (section.isMember("number")) {
        const Json::Value& number = section["number"];
        if (number.isNull()) {
            options.maxEvents.reset();
        } else if (number.isIntegral() && number.isUInt64() && number.asUInt64() > 0) {
            options.maxEvents = static_cast<size_t>(number.asUInt64());
        } else {
            throw ConfigurationError("Invalid value for split.number in " + origin + ": expected a positive integer");
        }
    }
}

void load_options_file(const std::string& path, SplitOptions& options) {
    std::ifstream configFile(path);
    if (!configFile) {
        throw ConfigurationError("Cannot open config file: " + path);
    }
    Json::Value config;
    Json::CharReaderBuilder builder;
    std::string errs;
    if (!Json::parseFromStream(builder, configFile, &config, &errs)) {
        throw ConfigurationError("Failed to parse " + path + ": " + errs);
    }
    if (!config.isObject()) {
        throw ConfigurationError("Config file " + path + " must contain a JSON object");
    }
    if (config.isMember("split")) {
        apply_options_json(config["split"], options, path);
    }
}

void apply_command_line(const CommandLine& cli, SplitOptions& options) {
    options.inputPath = cli.input;
    if (cli.size) options.size = *cli.size;
    if (cli.number) options.maxEvents = parse_event_limit(*cli.number);
    if (cli.encoding) options.encoding = *cli.encoding;
    if (cli.outputPrefix) options.outputPrefix = *cli.outputPrefix;
    if (cli.outputDir) options.outputDir = *cli.outputDir;
    options.quiet = options.quiet || cli.quiet;
    options.json = options.json || cli.json;
    options.verbose = cli.verbose;
    options.dryRun = options.dryRun || cli.dryRun;
    options.overwrite = options.overwrite || cli.overwrite;
}

void resolve_output_paths(SplitOptions& options) {
    bool fromStdin = options.inputPath.empty() || options.inputPath == "-";
    if (options.outputDir.empty()) {
        if (fromStdin) {
            options.outputDir = std::filesystem::current_path().string();
        } else {
            options.outputDir = std::filesystem::absolute(options.inputPath).parent_path().string();
        }
    }
    if (options.outputPrefix.empty()) {
        options.outputPrefix = fromStdin ? "calendar" : default_output_prefix(options.inputPath);
    }
}

SplitConfig make_split_config(const SplitOptions& options) {
    SplitConfig config;
    config.maxBytes = parse_size(options.size);
    config.maxEvents = options.maxEvents;
    return config;
}
