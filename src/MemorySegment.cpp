#include "MemorySegment.hpp"
#include <filesystem>
#include <system_error>
#include <boost/interprocess/exceptions.hpp>
#include <boost/interprocess/file_mapping.hpp>
#include <boost/interprocess/mapped_region.hpp>
#include "SplitErrors.hpp"

MemorySegment::MemorySegment(const std::string& path)
    : filePath(path),
      segmentSize(0) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        throw InputError("Cannot open input file: " + path);
    }
    auto fileSize = std::filesystem::file_size(path, ec);
    if (ec) {
        throw InputError("Cannot open input file: " + path + ": " + ec.message());
    }
    // mapped_region refuses zero-length mappings
    if (fileSize == 0) {
        return;
    }
    try {
        boost::interprocess::file_mapping mapping(path.c_str(), boost::interprocess::read_only);
        boost::interprocess::mapped_region mapped(mapping, boost::interprocess::read_only);
        fileMapping.swap(mapping);
        region.swap(mapped);
    } catch (const boost::interprocess::interprocess_exception& e) {
        throw InputError("Cannot map input file: " + path + ": " + e.what());
    }
    segmentSize = region.get_size();
}

size_t MemorySegment::size() const {
    return segmentSize;
}

const char* MemorySegment::data() const {
    return segmentSize == 0 ? nullptr : static_cast<const char*>(region.get_address());
}

const std::string& MemorySegment::path() const {
    return filePath;
}
