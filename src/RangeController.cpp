#include "RangeController.hpp"
#include <charconv>
#include <stdexcept>
#include <system_error>
#include <trantor/utils/Logger.h>

namespace {

bool parseInt64(const std::string& text, std::int64_t& out) {
    if (text.empty()) {
        return false;
    }
    const char* first = text.data();
    const char* last = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(first, last, out);
    return ec == std::errc() && ptr == last;
}

}  // namespace

const std::string* RangeReply::header(const std::string& name) const {
    for (const auto& h : headers) {
        if (h.first == name) {
            return &h.second;
        }
    }
    return nullptr;
}

RangeController::RangeController(std::shared_ptr<RangeService> service, ServerConfig config)
    : service_(std::move(service)), config_(std::move(config)) {
    if (!service_) {
        throw std::invalid_argument("RangeController requires a RangeService");
    }
}

std::optional<RangeRequest> RangeController::parseQuery(const std::string& start, const std::string& length, std::string& error) const {
    RangeRequest request;
    request.offset = 0;
    request.length = config_.defaultLength;

    if (!start.empty() && !parseInt64(start, request.offset)) {
        error = "start is not an integer";
        return std::nullopt;
    }
    if (!length.empty() && !parseInt64(length, request.length)) {
        error = "length is not an integer";
        return std::nullopt;
    }
    if (request.offset < 0) {
        error = "start must be non-negative";
        return std::nullopt;
    }
    if (request.length <= 0) {
        error = "length must be positive";
        return std::nullopt;
    }
    if (request.length > service_->maxRange()) {
        error = "length exceeds " + std::to_string(service_->maxRange());
        return std::nullopt;
    }
    return request;
}

RangeReply RangeController::textReply(int status, const std::string& body) const {
    RangeReply reply;
    reply.status = status;
    reply.body = body;
    reply.headers.emplace_back("Cache-Control", "no-store");
    return reply;
}

RangeReply RangeController::handle(const std::string& start, const std::string& length) const {
    LOG_DEBUG << "Range request start=" << start << " length=" << length;

    std::string error;
    auto request = parseQuery(start, length, error);
    if (!request) {
        LOG_WARN << "Invalid range query start='" << start << "' length='" << length << "': " << error;
        return textReply(400, "Invalid query");
    }

    ReadResult result = service_->read(config_.objectKey, request->offset, request->length);
    switch (result.status) {
        case ReadStatus::Found: {
            RangeReply reply;
            reply.status = 200;
            reply.body = std::move(result.bytes);
            reply.headers.emplace_back("Cache-Control", "public, max-age=" + std::to_string(config_.cacheMaxAge));
            return reply;
        }
        case ReadStatus::ObjectNotFound:
            return textReply(404, "pi file not found");
        case ReadStatus::InvalidRequest:
            LOG_WARN << "Range read rejected: " << result.message;
            return textReply(400, "Invalid query");
        case ReadStatus::TransientFailure: {
            RangeReply reply = textReply(503, "Temporarily unavailable");
            reply.headers.emplace_back("Retry-After", std::to_string(config_.retryAfter));
            return reply;
        }
    }
    return textReply(500, "Internal error");
}

drogon::HttpResponsePtr RangeController::toHttpResponse(const RangeReply& reply) {
    auto resp = drogon::HttpResponse::newHttpResponse();
    resp->setStatusCode(static_cast<drogon::HttpStatusCode>(reply.status));
    resp->setContentTypeCode(drogon::CT_TEXT_PLAIN);
    for (const auto& h : reply.headers) {
        resp->addHeader(h.first, h.second);
    }
    resp->setBody(reply.body);
    return resp;
}

void RangeController::corsPreflight(const drogon::HttpRequestPtr& req,
                                    std::function<void(const drogon::HttpResponsePtr&)>&& respond,
                                    std::function<void()>&& next) {
    if (req->method() != drogon::Options) {
        next();
        return;
    }
    auto resp = drogon::HttpResponse::newHttpResponse();
    resp->addHeader("Access-Control-Allow-Origin", "*");
    resp->addHeader("Access-Control-Allow-Methods", "GET, OPTIONS");
    resp->addHeader("Access-Control-Allow-Headers", "Content-Type");
    respond(resp);
}

void RangeController::addCorsHeaders(const drogon::HttpRequestPtr&, const drogon::HttpResponsePtr& resp) {
    resp->addHeader("Access-Control-Allow-Origin", "*");
}

void RangeController::handleHttp(const drogon::HttpRequestPtr& req,
                                 std::function<void(const drogon::HttpResponsePtr&)>&& callback) const {
    RangeReply reply = handle(req->getParameter("start"), req->getParameter("length"));
    callback(toHttpResponse(reply));
}
