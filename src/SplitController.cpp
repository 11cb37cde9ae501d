#include "SplitController.hpp"
#include <utility>
#include "CalendarSplitter.hpp"
#include "ChunkSink.hpp"
#include "LineSource.hpp"
#include "SizeSpec.hpp"
#include "SplitErrors.hpp"
#include "SplitOptions.hpp"
#include "TextEncoding.hpp"

SplitController::SplitController(std::string defaultSize, std::string defaultEncoding)
    : defaultSize_(std::move(defaultSize)), defaultEncoding_(std::move(defaultEncoding)) {
}

Json::Value SplitController::describe() const {
    Json::Value tool;
    tool["name"] = "split";
    tool["description"] = "Split an iCalendar document into independently valid calendars bounded by size and/or event count";
    tool["inputSchema"]["type"] = "object";

    tool["inputSchema"]["properties"]["calendar"]["type"] = "string";
    tool["inputSchema"]["properties"]["calendar"]["description"] = "Complete calendar text; the first line must be BEGIN:VCALENDAR";

    tool["inputSchema"]["properties"]["size"]["type"] = "string";
    tool["inputSchema"]["properties"]["size"]["description"] = "Maximum size per chunk, e.g. 500K or 1M";
    tool["inputSchema"]["properties"]["size"]["default"] = defaultSize_;

    tool["inputSchema"]["properties"]["number"]["type"] = "number";
    tool["inputSchema"]["properties"]["number"]["description"] = "Maximum number of events per chunk (unbounded when omitted)";

    tool["inputSchema"]["properties"]["encoding"]["type"] = "string";
    tool["inputSchema"]["properties"]["encoding"]["description"] = "Charset used to measure chunk sizes";
    tool["inputSchema"]["properties"]["encoding"]["default"] = defaultEncoding_;

    tool["inputSchema"]["properties"]["prefix"]["type"] = "string";
    tool["inputSchema"]["properties"]["prefix"]["default"] = "calendar";

    tool["inputSchema"]["properties"]["include_content"]["type"] = "boolean";
    tool["inputSchema"]["properties"]["include_content"]["default"] = true;

    tool["inputSchema"]["required"].append("calendar");
    return tool;
}

Json::Value SplitController::createError(const std::string& code, const std::string& message) const {
    Json::Value result;
    result["__error__"] = message;
    result["code"] = code;
    return result;
}

Json::Value SplitController::split(const Json::Value& params) const {
    if (!params.isObject() || !params["calendar"].isString()) {
        return createError("invalid_request", "calendar must be a string");
    }
    for (const char* key : {"size", "encoding", "prefix"}) {
        if (params.isMember(key) && !params[key].isString()) {
            return createError("invalid_request", std::string(key) + " must be a string");
        }
    }
    if (params.isMember("include_content") && !params["include_content"].isBool()) {
        return createError("invalid_request", "include_content must be a boolean");
    }

    std::string calendar = params["calendar"].asString();
    std::string size = params.get("size", defaultSize_).asString();
    std::string encodingName = params.get("encoding", defaultEncoding_).asString();
    std::string prefix = params.get("prefix", "calendar").asString();
    bool includeContent = params.get("include_content", true).asBool();

    Json::Value result;
    try {
        SplitConfig config;
        config.maxBytes = parse_size(size);
        if (params.isMember("number") && !params["number"].isNull()) {
            const Json::Value& number = params["number"];
            if (number.isString()) {
                config.maxEvents = parse_event_limit(number.asString());
            } else if (number.isIntegral() && number.isUInt64() && number.asUInt64() > 0) {
                config.maxEvents = static_cast<size_t>(number.asUInt64());
            } else {
                return createError("configuration", "number must be a positive integer");
            }
        }
        TextEncoding encoding(encodingName);

        MemoryChunkSink sink;
        CalendarSplitter splitter(config, sink, encoding);
        BufferLineSource source(calendar.data(), calendar.size());
        splitter.split(source);

        Json::Value chunks(Json::arrayValue);
        for (const auto& collected : sink.chunks()) {
            Json::Value chunk;
            chunk["index"] = (Json::UInt64)collected.descriptor.index;
            chunk["filename"] = part_file_name(prefix, collected.descriptor.index);
            chunk["size"] = (Json::UInt64)collected.descriptor.sizeBytes;
            chunk["events"] = (Json::UInt64)collected.descriptor.eventCount;
            if (includeContent) {
                chunk["content"] = collected.content;
            }
            chunks.append(chunk);
        }
        result["count"] = (Json::UInt64)chunks.size();
        result["chunks"] = chunks;
    } catch (const InvalidFormatError& e) {
        return createError("invalid_format", e.what());
    } catch (const ConfigurationError& e) {
        return createError("configuration", e.what());
    } catch (const EncodingError& e) {
        return createError("encoding", e.what());
    } catch (const SplitError& e) {
        return createError("split", e.what());
    }
    return result;
}
