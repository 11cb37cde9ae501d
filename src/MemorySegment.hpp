#pragma once
#include <string>
#include <boost/interprocess/file_mapping.hpp>
#include <boost/interprocess/mapped_region.hpp>

// Read-only mapping of an input calendar file. A zero-length file yields an empty segment.
class MemorySegment {
public:
    explicit MemorySegment(const std::string& path);

    size_t size() const;
    const char* data() const;
    const std::string& path() const;

private:
    std::string filePath;
    boost::interprocess::file_mapping fileMapping;
    boost::interprocess::mapped_region region;
    size_t segmentSize;
};
