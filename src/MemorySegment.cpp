#include "MemorySegment.hpp"
#include <algorithm>

MemorySegment::MemorySegment(const std::string& path, std::uint64_t fileSize)
    : segmentSize(fileSize) {
    if (segmentSize == 0) {
        return;
    }
    boost::interprocess::file_mapping mapping(path.c_str(), boost::interprocess::read_only);
    boost::interprocess::mapped_region mapped(mapping, boost::interprocess::read_only);
    fileMapping.swap(mapping);
    region.swap(mapped);
    segmentSize = region.get_size();
    region.advise(boost::interprocess::mapped_region::advice_sequential);
}

MemorySegment::~MemorySegment() {}

std::uint64_t MemorySegment::size() const {
    return segmentSize;
}

const char* MemorySegment::data() const {
    return static_cast<const char*>(region.get_address());
}

std::string MemorySegment::read(std::uint64_t offset, std::uint64_t length) const {
    if (offset >= segmentSize || length == 0) {
        return std::string();
    }
    std::uint64_t n = std::min(length, segmentSize - offset);
    return std::string(data() + offset, static_cast<std::size_t>(n));
}
