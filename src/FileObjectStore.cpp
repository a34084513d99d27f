#include "FileObjectStore.hpp"
#include <mutex>
#include <stdexcept>
#include <system_error>
#include <boost/interprocess/exceptions.hpp>

namespace fs = std::filesystem;

FileObjectStore::FileObjectStore(const std::string& rootDir) {
    std::error_code ec;
    rootPath = fs::canonical(rootDir, ec);
    if (ec || !fs::is_directory(rootPath)) {
        throw std::invalid_argument("Object root is not a directory: " + rootDir);
    }
}

std::optional<fs::path> FileObjectStore::resolve(const std::string& key) const {
    if (key.empty()) {
        return std::nullopt;
    }
    fs::path relative(key);
    if (relative.is_absolute()) {
        return std::nullopt;
    }

    std::error_code ec;
    fs::path canonical = fs::canonical(rootPath / relative, ec);
    if (ec) {
        return std::nullopt;
    }

    // Symlinks and '..' must not lead outside the root
    const std::string rootStr = rootPath.string();
    const std::string candidate = canonical.string();
    if (candidate.size() <= rootStr.size() + 1 ||
        candidate.compare(0, rootStr.size() + 1, rootStr + "/") != 0) {
        return std::nullopt;
    }
    return canonical;
}

std::shared_ptr<MemorySegment> FileObjectStore::segmentFor(const std::string& key) {
    {
        std::shared_lock lock(mutex);
        auto it = segments.find(key);
        if (it != segments.end()) {
            return it->second;
        }
    }

    auto path = resolve(key);
    if (!path) {
        return nullptr;
    }

    std::error_code ec;
    if (!fs::is_regular_file(*path, ec)) {
        if (ec && ec != std::errc::no_such_file_or_directory) {
            throw ObjectStoreError("Cannot stat object " + key + ": " + ec.message());
        }
        return nullptr;
    }
    std::uint64_t fileSize = fs::file_size(*path, ec);
    if (ec) {
        throw ObjectStoreError("Cannot size object " + key + ": " + ec.message());
    }

    std::shared_ptr<MemorySegment> segment;
    try {
        segment = std::make_shared<MemorySegment>(path->string(), fileSize);
    } catch (const boost::interprocess::interprocess_exception& e) {
        throw ObjectStoreError("Cannot map object " + key + ": " + e.what());
    }

    std::unique_lock lock(mutex);
    auto inserted = segments.emplace(key, segment);
    return inserted.first->second;
}

std::optional<std::string> FileObjectStore::get(const std::string& key, std::uint64_t offset, std::uint64_t length) {
    auto segment = segmentFor(key);
    if (!segment) {
        return std::nullopt;
    }
    return segment->read(offset, length);
}

std::shared_ptr<MemorySegment> FileObjectStore::preload(const std::string& key) {
    return segmentFor(key);
}

void FileObjectStore::close(const std::string& key) {
    std::unique_lock lock(mutex);
    segments.erase(key);
}
