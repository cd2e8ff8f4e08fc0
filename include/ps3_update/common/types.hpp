#pragma once

#include <string>
#include <vector>
#include <chrono>
#include <optional>
#include <cstdint>
#include <cstddef>

namespace ps3_update {
namespace common {

struct PackageDescriptor {
    std::string version;
    std::string system_ver;
    uint64_t size_bytes = 0;
    std::string size_human;
    std::string url;
    std::string sha1;
    std::string filename;
};

struct DiscoveryResult {
    std::vector<PackageDescriptor> results;
    std::optional<std::string> error;
    std::string game_title;
    std::string cleaned_title_id;
};

struct TransferMode {
    enum class Kind {
        DIRECT,
        MULTI_PART
    };
    
    Kind kind = Kind::DIRECT;
    size_t parts = 1;
    
    static TransferMode direct() { return TransferMode{}; }
    
    static TransferMode multiPart(size_t parts) {
        TransferMode mode;
        mode.kind = Kind::MULTI_PART;
        mode.parts = parts == 0 ? 1 : parts;
        return mode;
    }
    
    bool isMultiPart() const { return kind == Kind::MULTI_PART; }
};

struct TransferJob {
    std::string id;
    std::string filename;
    uint64_t total = 0;
    uint64_t transferred = 0;
    std::chrono::steady_clock::time_point created;
    bool done = false;
    std::optional<std::string> error;
};

struct ProgressSnapshot {
    std::string job_id;
    std::string filename;
    uint64_t total = 0;
    uint64_t transferred = 0;
    double percent = 0.0;
    double bytes_per_second = 0.0;
    std::string throughput_human;
    bool done = false;
    std::optional<std::string> error;
};

std::string to_string(TransferMode mode);

}}
