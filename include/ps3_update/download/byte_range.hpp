#pragma once

#include <cstdint>
#include <cstddef>
#include <string>
#include <vector>

namespace ps3_update {
namespace download {

// Inclusive [start, end] byte range.
struct ByteRange {
    uint64_t start = 0;
    uint64_t end = 0;
    
    uint64_t length() const { return end - start + 1; }
    std::string header() const;
    
    bool operator==(const ByteRange& other) const {
        return start == other.start && end == other.end;
    }
};

// Splits [0, total) into at most `parts` contiguous ranges that cover every
// byte exactly once. Fewer ranges come back when total < parts.
std::vector<ByteRange> planRanges(uint64_t total, size_t parts);

}}
