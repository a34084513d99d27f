#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <json/json.h>
#include "../src/ServerConfig.hpp"

#define ASSERT_TRUE(cond) if(!(cond)) { std::cerr << "Assertion failed: " << #cond << " at " << __FILE__ << ":" << __LINE__ << std::endl; return 1; }

static Json::Value parse(const std::string& text) {
    Json::CharReaderBuilder builder;
    Json::Value root;
    std::string errs;
    std::istringstream iss(text);
    if (!Json::parseFromStream(builder, iss, &root, &errs)) {
        throw std::runtime_error(errs);
    }
    return root;
}

static bool rejects(const std::string& text) {
    try {
        parseServerConfig(parse(text));
    } catch (const std::invalid_argument&) {
        return true;
    }
    return false;
}

int main() {
    try {
        // No section: defaults
        ServerConfig cfg = parseServerConfig(parse(R"({"listeners": []})"));
        ASSERT_TRUE(cfg.objectKey == "pi-billion.txt");
        ASSERT_TRUE(cfg.objectRoot == ".");
        ASSERT_TRUE(cfg.maxRange == kDefaultMaxRange);
        ASSERT_TRUE(cfg.defaultLength == 1000);
        ASSERT_TRUE(cfg.cacheMaxAge == 86400);

        // Overrides, partial section keeps the rest
        cfg = parseServerConfig(parse(R"({"pistream": {"object_root": "/data", "max_range": 5000, "default_length": 250}})"));
        ASSERT_TRUE(cfg.objectRoot == "/data");
        ASSERT_TRUE(cfg.maxRange == 5000);
        ASSERT_TRUE(cfg.defaultLength == 250);
        ASSERT_TRUE(cfg.objectKey == "pi-billion.txt");
        ASSERT_TRUE(cfg.retryAfter == 3);

        // Validation
        ASSERT_TRUE(rejects(R"({"pistream": {"max_range": 0}})"));
        ASSERT_TRUE(rejects(R"({"pistream": {"max_range": 10000001}})"));
        ASSERT_TRUE(rejects(R"({"pistream": {"max_range": "lots"}})"));
        ASSERT_TRUE(rejects(R"({"pistream": {"max_range": 100, "default_length": 101}})"));
        ASSERT_TRUE(rejects(R"({"pistream": {"default_length": 0}})"));
        ASSERT_TRUE(rejects(R"({"pistream": {"cache_max_age": -1}})"));
        ASSERT_TRUE(rejects(R"({"pistream": {"object_key": ""}})"));
        ASSERT_TRUE(rejects(R"({"pistream": {"object_key": 12}})"));
        ASSERT_TRUE(rejects(R"({"pistream": []})"));

        // The section lives under drogon's custom_config in the app config file
        Json::Value appConfig = parse(R"({
            "listeners": [{"address": "0.0.0.0", "port": 8080}],
            "app": {"number_of_threads": 2},
            "custom_config": {"pistream": {"object_key": "pi.txt", "cache_max_age": 60, "retry_after": 7}}
        })");
        cfg = parseServerConfig(appConfig["custom_config"]);
        ASSERT_TRUE(cfg.objectKey == "pi.txt");
        ASSERT_TRUE(cfg.cacheMaxAge == 60);
        ASSERT_TRUE(cfg.retryAfter == 7);
        ASSERT_TRUE(cfg.maxRange == kDefaultMaxRange);

        // No custom_config at all yields defaults
        cfg = parseServerConfig(Json::Value());
        ASSERT_TRUE(cfg.objectKey == "pi-billion.txt");
        ASSERT_TRUE(cfg.retryAfter == 3);

    } catch (const std::exception& e) {
        std::cerr << "Exception: " << e.what() << std::endl;
        return 1;
    }
    std::cout << "All server config tests passed" << std::endl;
    return 0;
}
