#include <cstdio>
#include <filesystem>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <trantor/net/EventLoop.h>
#include <trantor/utils/Logger.h>
#include "FileObjectStore.hpp"
#include "HttpRangeFetcher.hpp"
#include "PrefetchManager.hpp"
#include "RangeService.hpp"

namespace {

constexpr double kDemandInterval = 0.1;

bool isHttpUrl(const std::string& s) {
    return s.rfind("http://", 0) == 0 || s.rfind("https://", 0) == 0;
}

void usage(const char* prog) {
    std::cerr << "Usage: " << prog << " <http://host:port/api/pi | path/to/object> [start] [max-bytes]" << std::endl;
}

}  // namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        usage(argv[0]);
        return 2;
    }
    const std::string source = argv[1];
    std::uint64_t start = 0;
    std::uint64_t maxBytes = 0;
    try {
        if (argc > 2) start = std::stoull(argv[2]);
        if (argc > 3) maxBytes = std::stoull(argv[3]);
    } catch (const std::exception&) {
        usage(argv[0]);
        return 2;
    }

    // stdout carries the digits
    trantor::Logger::setOutputFunction(
        [](const char* msg, const uint64_t len) { std::fwrite(msg, 1, len, stderr); },
        []() { std::fflush(stderr); });

    trantor::EventLoop loop;
    EventLoopScheduler scheduler(&loop);

    std::unique_ptr<RangeFetcher> fetcher;
    try {
        if (isHttpUrl(source)) {
            fetcher = std::make_unique<HttpRangeFetcher>(source, &loop);
        } else {
            std::filesystem::path object(source);
            auto root = object.has_parent_path() ? object.parent_path().string() : std::string(".");
            auto store = std::make_shared<FileObjectStore>(root);
            auto service = std::make_shared<RangeService>(store);
            fetcher = std::make_unique<LocalRangeFetcher>(service, object.filename().string(), scheduler);
        }
    } catch (const std::exception& e) {
        LOG_ERROR << e.what();
        return 1;
    }

    PrefetchConfig config;
    config.startOffset = start;
    try {
        config.validate();
    } catch (const std::invalid_argument& e) {
        LOG_ERROR << e.what();
        return 2;
    }
    PrefetchManager manager(config, *fetcher, scheduler);
    manager.subscribe([](SessionState state, const std::string& detail) {
        if (state == SessionState::Prefetching && !detail.empty()) {
            LOG_INFO << "loading: " << detail;
        }
    });

    std::uint64_t written = 0;
    int exitCode = 0;
    loop.runEvery(kDemandInterval, [&]() {
        DemandResult r = manager.requestMore();
        switch (r.kind) {
            case DemandKind::Chunk: {
                std::size_t n = r.bytes.size();
                if (maxBytes > 0 && written + n > maxBytes) {
                    n = static_cast<std::size_t>(maxBytes - written);
                }
                std::fwrite(r.bytes.data(), 1, n, stdout);
                std::fflush(stdout);
                written += n;
                if (maxBytes > 0 && written >= maxBytes) {
                    manager.close();
                    loop.quit();
                }
                break;
            }
            case DemandKind::NotReady:
                break;
            case DemandKind::EndOfStream:
                LOG_INFO << "end of stream after " << written << " bytes";
                loop.quit();
                break;
            case DemandKind::Failed:
                LOG_ERROR << "stream failed: " << r.error;
                exitCode = 1;
                loop.quit();
                break;
        }
    });

    manager.start();
    loop.loop();
    std::fputc('\n', stdout);
    return exitCode;
}
