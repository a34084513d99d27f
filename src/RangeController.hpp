#pragma once
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include <drogon/HttpRequest.h>
#include <drogon/HttpResponse.h>
#include "RangeService.hpp"
#include "ServerConfig.hpp"

// Transport-neutral reply for one range request. Bodies are always text/plain.
struct RangeReply {
    int status = 200;
    std::string body;
    std::vector<std::pair<std::string, std::string>> headers;

    const std::string* header(const std::string& name) const;
};

class RangeController {
public:
    RangeController(std::shared_ptr<RangeService> service, ServerConfig config);

    // Parses raw 'start' and 'length' query values. Empty values take the
    // defaults. Returns std::nullopt and fills 'error' on malformed input.
    std::optional<RangeRequest> parseQuery(const std::string& start, const std::string& length, std::string& error) const;

    RangeReply handle(const std::string& start, const std::string& length) const;

    void handleHttp(const drogon::HttpRequestPtr& req,
                    std::function<void(const drogon::HttpResponsePtr&)>&& callback) const;

    static drogon::HttpResponsePtr toHttpResponse(const RangeReply& reply);

    // Pre-handling advice: answers an OPTIONS preflight through 'respond',
    // passes every other request on through 'next'.
    static void corsPreflight(const drogon::HttpRequestPtr& req,
                              std::function<void(const drogon::HttpResponsePtr&)>&& respond,
                              std::function<void()>&& next);

    // Post-handling advice.
    static void addCorsHeaders(const drogon::HttpRequestPtr& req, const drogon::HttpResponsePtr& resp);

    const ServerConfig& config() const { return config_; }

private:
    RangeReply textReply(int status, const std::string& body) const;

    std::shared_ptr<RangeService> service_;
    ServerConfig config_;
};
