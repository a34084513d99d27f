#include <drogon/drogon.h>
#include <filesystem>
#include <memory>
#include <string>
#include "FileObjectStore.hpp"
#include "RangeController.hpp"
#include "RangeService.hpp"
#include "ServerConfig.hpp"

int main(int argc, char* argv[]) {
    using namespace drogon;

    const std::string configPath = argc > 1 ? argv[1] : "config.json";

    ServerConfig config;
    if (std::filesystem::exists(configPath)) {
        app().loadConfigFile(configPath);
        try {
            config = parseServerConfig(app().getCustomConfig());
        } catch (const std::exception& e) {
            LOG_FATAL << "Invalid configuration in " << configPath << ": " << e.what();
            return 1;
        }
    } else {
        LOG_WARN << "No " << configPath << " found, using defaults on port 8080";
        app().addListener("0.0.0.0", 8080);
    }

    std::shared_ptr<FileObjectStore> store;
    try {
        store = std::make_shared<FileObjectStore>(config.objectRoot);
    } catch (const std::exception& e) {
        LOG_FATAL << e.what();
        return 1;
    }

    try {
        auto segment = store->preload(config.objectKey);
        if (segment) {
            LOG_INFO << "Serving " << config.objectKey << " (" << segment->size() << " bytes) from " << store->root().string();
        } else {
            LOG_ERROR << "Object " << config.objectKey << " not found under " << store->root().string()
                      << "; range reads will return 404";
        }
    } catch (const ObjectStoreError& e) {
        LOG_ERROR << "Preload failed: " << e.what();
    }

    auto service = std::make_shared<RangeService>(store, config.maxRange);
    auto controller = std::make_shared<RangeController>(service, config);
    LOG_INFO << "max_range=" << config.maxRange << " default_length=" << config.defaultLength
             << " cache_max_age=" << config.cacheMaxAge;

    auto handler = [controller](const HttpRequestPtr& req, std::function<void(const HttpResponsePtr&)>&& callback) {
        controller->handleHttp(req, std::move(callback));
    };
    app().registerHandler("/api/pi", handler, {Get});
    app().registerHandler("/", handler, {Get});

    // CORS support
    app().registerPreHandlingAdvice(&RangeController::corsPreflight);
    app().registerPostHandlingAdvice(&RangeController::addCorsHeaders);

    LOG_INFO << "Range endpoint: GET /api/pi?start=<offset>&length=<1.." << config.maxRange << ">";
    app().run();
    return 0;
}
