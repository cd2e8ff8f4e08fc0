#include "ps3_update/download/byte_range.hpp"
#include <algorithm>

namespace ps3_update {
namespace download {

std::string ByteRange::header() const {
    return "bytes=" + std::to_string(start) + "-" + std::to_string(end);
}

std::vector<ByteRange> planRanges(uint64_t total, size_t parts) {
    std::vector<ByteRange> ranges;
    if (total == 0) {
        return ranges;
    }

    parts = std::max<size_t>(parts, 1);
    uint64_t part_size = std::max<uint64_t>(total / parts, 1);
    uint64_t last_byte = total - 1;
    uint64_t start = 0;

    for (size_t i = 0; i < parts; ++i) {
        uint64_t end = start + part_size - 1;
        if (i == parts - 1 || end >= last_byte) {
            end = last_byte;
        }
        ranges.push_back({start, end});

        start = end + 1;
        if (start >= total) {
            break;
        }
    }

    return ranges;
}

}}
