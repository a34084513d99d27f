#pragma once
#include <cstdint>
#include <string>
#include <json/json.h>
#include "RangeTypes.hpp"

struct ServerConfig {
    std::string objectRoot = ".";
    std::string objectKey = "pi-billion.txt";
    std::int64_t maxRange = kDefaultMaxRange;
    std::int64_t defaultLength = kDefaultReadLength;
    std::int64_t cacheMaxAge = 86400;
    std::int64_t retryAfter = 3;
};

// Reads the "pistream" section of drogon's custom_config object. Missing keys
// keep their defaults; out-of-range values throw std::invalid_argument.
ServerConfig parseServerConfig(const Json::Value& customConfig);
