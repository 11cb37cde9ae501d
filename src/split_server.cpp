#include <drogon/drogon.h>
#include <json/json.h>
#include <filesystem>
#include <fstream>
#include <string>
#include "SplitController.hpp"

namespace {

Json::Value errorBody(const std::string& code, const std::string& message) {
    Json::Value body;
    body["error"]["code"] = code;
    body["error"]["message"] = message;
    return body;
}

struct ServerSettings {
    std::string defaultSize = "1M";
    std::string defaultEncoding = "utf-8";
    int port = 8080;
};

// Reads the listener port and the custom "icssplit" section (default_size, default_encoding).
ServerSettings loadSettings(const std::string& configPath) {
    ServerSettings settings;
    std::ifstream configFile(configPath);
    if (!configFile) {
        std::cout << "No " << configPath << " found, using defaults" << std::endl;
        return settings;
    }
    Json::Value config;
    Json::CharReaderBuilder builder;
    std::string errs;
    if (!Json::parseFromStream(builder, configFile, &config, &errs)) {
        std::cout << "Failed to parse " << configPath << ": " << errs << std::endl;
        return settings;
    }
    const Json::Value& listeners = config["listeners"];
    if (listeners.isArray() && !listeners.empty() && listeners[0]["port"].isInt()) {
        settings.port = listeners[0]["port"].asInt();
    }
    const Json::Value& section = config["icssplit"];
    if (section.isObject()) {
        if (section["default_size"].isString()) {
            settings.defaultSize = section["default_size"].asString();
        }
        if (section["default_encoding"].isString()) {
            settings.defaultEncoding = section["default_encoding"].asString();
        }
        std::cout << "icssplit config section found (default size " << settings.defaultSize
                  << ", encoding " << settings.defaultEncoding << ")" << std::endl;
    }
    return settings;
}

}

// POST /split
// JSON body: forwarded to SplitController as is.
// Any other body: raw calendar text; size, number, encoding and prefix come from the query string.
void handleSplitRequest(const SplitController& controller, const drogon::HttpRequestPtr& req,
                        std::function<void(const drogon::HttpResponsePtr&)>&& callback) {
    Json::Value params;
    if (req->contentType() == drogon::CT_APPLICATION_JSON) {
        auto json = req->getJsonObject();
        if (!json) {
            auto resp = drogon::HttpResponse::newHttpJsonResponse(errorBody("invalid_request", "Invalid JSON"));
            resp->setStatusCode(drogon::HttpStatusCode::k400BadRequest);
            callback(resp);
            return;
        }
        params = *json;
    } else {
        params["calendar"] = std::string(req->body());
        for (const char* key : {"size", "number", "encoding", "prefix"}) {
            const std::string& value = req->getParameter(key);
            if (!value.empty()) {
                params[key] = value;
            }
        }
    }

    Json::Value result = controller.split(params);
    if (result.isMember("__error__")) {
        auto resp = drogon::HttpResponse::newHttpJsonResponse(
            errorBody(result["code"].asString(), result["__error__"].asString()));
        resp->setStatusCode(drogon::HttpStatusCode::k400BadRequest);
        callback(resp);
        return;
    }
    callback(drogon::HttpResponse::newHttpJsonResponse(result));
}

int main(int argc, char** argv) {
    using namespace drogon;

    std::string configPath = argc > 1 ? argv[1] : "config.json";
    ServerSettings settings = loadSettings(configPath);
    if (std::filesystem::exists(configPath)) {
        app().loadConfigFile(configPath);
    } else {
        app().addListener("0.0.0.0", static_cast<uint16_t>(settings.port));
    }
    static const SplitController controller(settings.defaultSize, settings.defaultEncoding);

    app().registerHandler("/split",
        [](const HttpRequestPtr& req, std::function<void(const HttpResponsePtr&)>&& callback) {
            handleSplitRequest(controller, req, std::move(callback));
        },
        {Post});

    app().registerHandler("/split/schema",
        [](const HttpRequestPtr&, std::function<void(const HttpResponsePtr&)>&& callback) {
            callback(HttpResponse::newHttpJsonResponse(controller.describe()));
        },
        {Get});

    // CORS preflight
    app().registerSyncAdvice([](const HttpRequestPtr& req) -> HttpResponsePtr {
        if (req->method() == Options) {
            auto resp = HttpResponse::newHttpResponse();
            resp->addHeader("Access-Control-Allow-Origin", "*");
            resp->addHeader("Access-Control-Allow-Methods", "GET, POST, OPTIONS");
            resp->addHeader("Access-Control-Allow-Headers", "Content-Type");
            return resp;
        }
        return nullptr;
    });

    app().registerPostHandlingAdvice([](const HttpRequestPtr&, const HttpResponsePtr& resp) {
        resp->addHeader("Access-Control-Allow-Origin", "*");
    });

    std::cout << "icssplit server starting on port " << settings.port << std::endl;
    std::cout << "  Split endpoint: http://localhost:" << settings.port << "/split" << std::endl;
    std::cout << "  Schema endpoint: http://localhost:" << settings.port << "/split/schema" << std::endl;
    app().run();

    return 0;
}
