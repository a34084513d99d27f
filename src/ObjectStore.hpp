#pragma once
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>

// Raised by stores on I/O failures. Callers treat it as transient.
class ObjectStoreError : public std::runtime_error {
public:
    explicit ObjectStoreError(const std::string& what) : std::runtime_error(what) {}
};

class ObjectStore {
public:
    virtual ~ObjectStore() = default;

    // Returns the bytes of [offset, offset + length) clipped to the object size.
    // std::nullopt means the object itself does not exist; an offset past the
    // end yields an empty string.
    virtual std::optional<std::string> get(const std::string& key, std::uint64_t offset, std::uint64_t length) = 0;
};
