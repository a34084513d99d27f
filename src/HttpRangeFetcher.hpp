#pragma once
#include <string>
#include <drogon/HttpClient.h>
#include "RangeFetcher.hpp"

// Fetches ranges from a remote range endpoint, e.g. http://host:8080/api/pi
class HttpRangeFetcher : public RangeFetcher {
public:
    HttpRangeFetcher(const std::string& baseUrl, trantor::EventLoop* loop);

    void fetch(std::uint64_t offset, std::uint64_t length, double timeoutSeconds, Completion done) override;

    // Maps an endpoint reply to a read outcome.
    static ReadResult classify(drogon::ReqResult result, int status, std::string body);

    const std::string& host() const { return host_; }
    const std::string& path() const { return path_; }

private:
    std::string host_;
    std::string path_;
    drogon::HttpClientPtr client_;
};
