#pragma once
#include <json/json.h>
#include <string>

// JSON front end to the splitter, shared by the HTTP service and the tests.
class SplitController {
public:
    explicit SplitController(std::string defaultSize = "1M", std::string defaultEncoding = "utf-8");

    // Request schema, in the same shape as an MCP tool description.
    Json::Value describe() const;

    // Splits params["calendar"] in memory.
    // Returns {"count", "chunks": [{"index", "filename", "size", "events", "content"?}]},
    // or {"__error__": message, "code": invalid_request|invalid_format|configuration|encoding|split}.
    Json::Value split(const Json::Value& params) const;

    Json::Value createError(const std::string& code, const std::string& message) const;

private:
    std::string defaultSize_;
    std::string defaultEncoding_;
};
