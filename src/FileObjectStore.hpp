#pragma once
#include <filesystem>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include "MemorySegment.hpp"
#include "ObjectStore.hpp"

// Object store over a local directory. Keys are paths relative to the root;
// each object is memory-mapped once and shared by all readers.
class FileObjectStore : public ObjectStore {
public:
    explicit FileObjectStore(const std::string& rootDir);

    std::optional<std::string> get(const std::string& key, std::uint64_t offset, std::uint64_t length) override;

    // Maps the object ahead of the first read. Returns nullptr when the object is absent.
    std::shared_ptr<MemorySegment> preload(const std::string& key);
    void close(const std::string& key);

    const std::filesystem::path& root() const { return rootPath; }

private:
    std::optional<std::filesystem::path> resolve(const std::string& key) const;
    std::shared_ptr<MemorySegment> segmentFor(const std::string& key);

    std::filesystem::path rootPath;
    std::unordered_map<std::string, std::shared_ptr<MemorySegment>> segments;
    mutable std::shared_mutex mutex;
};
