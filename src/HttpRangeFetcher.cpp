#include "HttpRangeFetcher.hpp"
#include <stdexcept>
#include <utility>
#include <drogon/HttpRequest.h>
#include <drogon/HttpResponse.h>
#include <trantor/utils/Logger.h>

HttpRangeFetcher::HttpRangeFetcher(const std::string& baseUrl, trantor::EventLoop* loop) {
    auto scheme = baseUrl.find("://");
    if (scheme == std::string::npos) {
        throw std::invalid_argument("Base URL must include a scheme: " + baseUrl);
    }
    auto slash = baseUrl.find('/', scheme + 3);
    host_ = baseUrl.substr(0, slash);
    path_ = slash == std::string::npos ? "/api/pi" : baseUrl.substr(slash);
    client_ = drogon::HttpClient::newHttpClient(host_, loop);
}

ReadResult HttpRangeFetcher::classify(drogon::ReqResult result, int status, std::string body) {
    if (result == drogon::ReqResult::Timeout) {
        return ReadResult::transient("request timed out");
    }
    if (result != drogon::ReqResult::Ok) {
        return ReadResult::transient("network error " + std::to_string(static_cast<int>(result)));
    }
    switch (status) {
        case 200:
            return ReadResult::found(std::move(body));
        case 404:
            return ReadResult::notFound(body.empty() ? std::string("object not found") : body);
        case 400:
            return ReadResult::invalid(body.empty() ? std::string("invalid request") : body);
        default:
            return ReadResult::transient("HTTP status " + std::to_string(status));
    }
}

void HttpRangeFetcher::fetch(std::uint64_t offset, std::uint64_t length, double timeoutSeconds, Completion done) {
    auto req = drogon::HttpRequest::newHttpRequest();
    req->setMethod(drogon::Get);
    req->setPath(path_);
    req->setParameter("start", std::to_string(offset));
    req->setParameter("length", std::to_string(length));

    LOG_DEBUG << "GET " << host_ << path_ << " start=" << offset << " length=" << length;
    client_->sendRequest(
        req,
        [done = std::move(done)](drogon::ReqResult result, const drogon::HttpResponsePtr& resp) {
            if (result != drogon::ReqResult::Ok || !resp) {
                done(classify(result == drogon::ReqResult::Ok ? drogon::ReqResult::BadResponse : result, 0, std::string()));
                return;
            }
            done(classify(result, static_cast<int>(resp->getStatusCode()), std::string(resp->body())));
        },
        timeoutSeconds);
}
