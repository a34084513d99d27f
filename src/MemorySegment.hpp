#pragma once
#include <cstdint>
#include <string>
#include <boost/interprocess/file_mapping.hpp>
#include <boost/interprocess/mapped_region.hpp>

// Read-only mapping of one object file. Zero-length files are not mapped.
class MemorySegment {
public:
    MemorySegment(const std::string& path, std::uint64_t fileSize);
    ~MemorySegment();

    MemorySegment(const MemorySegment&) = delete;
    MemorySegment& operator=(const MemorySegment&) = delete;

    std::uint64_t size() const;
    const char* data() const;

    // Copies [offset, offset + length) clipped to the segment end.
    std::string read(std::uint64_t offset, std::uint64_t length) const;

private:
    boost::interprocess::file_mapping fileMapping;
    boost::interprocess::mapped_region region;
    std::uint64_t segmentSize;
};
