#pragma once

#include "../common/types.hpp"
#include <cstdint>
#include <mutex>
#include <optional>
#include <random>
#include <string>
#include <unordered_map>
#include <vector>

namespace ps3_update {
namespace download {

// Shared ledger of transfer jobs. Every operation takes the registry lock, so
// counters updated from several range workers never lose increments.
class JobRegistry {
public:
    JobRegistry();
    
    JobRegistry(const JobRegistry&) = delete;
    JobRegistry& operator=(const JobRegistry&) = delete;
    
    std::string create(const std::string& filename);
    
    // Unknown ids are ignored: a removed job's writer simply becomes unobservable.
    void update(const std::string& job_id, uint64_t delta_bytes);
    void setTotal(const std::string& job_id, uint64_t total);
    void finish(const std::string& job_id, std::optional<std::string> error = std::nullopt);
    
    // Throws UpdateError(JOB_NOT_FOUND).
    common::ProgressSnapshot snapshot(const std::string& job_id) const;
    
    void remove(const std::string& job_id);
    
    std::optional<uint64_t> transferred(const std::string& job_id) const;
    bool contains(const std::string& job_id) const;
    size_t size() const;
    std::vector<std::string> jobIds() const;

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, common::TransferJob> jobs_;
    std::mt19937_64 rng_;
    
    std::string generateId();
};

}}
