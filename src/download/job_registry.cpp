#include "ps3_update/download/job_registry.hpp"
#include "ps3_update/download/progress.hpp"
#include "ps3_update/update/error_codes.hpp"
#include "ps3_update/common/logger.hpp"
#include <spdlog/fmt/fmt.h>
#include <chrono>
#include <limits>

namespace ps3_update {
namespace download {

JobRegistry::JobRegistry() {
    std::random_device device;
    std::seed_seq seed{device(), device(), device(), device()};
    rng_.seed(seed);
}

std::string JobRegistry::generateId() {
    std::string id;
    do {
        id = fmt::format("{:016x}", rng_());
    } while (jobs_.count(id) > 0);
    return id;
}

std::string JobRegistry::create(const std::string& filename) {
    std::lock_guard<std::mutex> lock(mutex_);

    common::TransferJob job;
    job.id = generateId();
    job.filename = filename;
    job.created = std::chrono::steady_clock::now();

    std::string id = job.id;
    jobs_.emplace(id, std::move(job));

    common::Logger::instance().debug("[Registry] Job created | id={} | file={}", id, filename);
    return id;
}

void JobRegistry::update(const std::string& job_id, uint64_t delta_bytes) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = jobs_.find(job_id);
    if (it == jobs_.end()) {
        return;
    }

    auto& transferred = it->second.transferred;
    if (delta_bytes > std::numeric_limits<uint64_t>::max() - transferred) {
        transferred = std::numeric_limits<uint64_t>::max();
    } else {
        transferred += delta_bytes;
    }
}

void JobRegistry::setTotal(const std::string& job_id, uint64_t total) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = jobs_.find(job_id);
    if (it != jobs_.end()) {
        it->second.total = total;
    }
}

void JobRegistry::finish(const std::string& job_id, std::optional<std::string> error) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = jobs_.find(job_id);
    if (it == jobs_.end()) {
        common::Logger::instance().debug("[Registry] Finish for removed job | id={}", job_id);
        return;
    }

    it->second.done = true;
    it->second.error = std::move(error);
}

common::ProgressSnapshot JobRegistry::snapshot(const std::string& job_id) const {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = jobs_.find(job_id);
    if (it == jobs_.end()) {
        throw update::UpdateError(update::UpdateErrorCode::JOB_NOT_FOUND, job_id);
    }

    return computeSnapshot(it->second, std::chrono::steady_clock::now());
}

void JobRegistry::remove(const std::string& job_id) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (jobs_.erase(job_id) > 0) {
        common::Logger::instance().debug("[Registry] Job removed | id={}", job_id);
    }
}

std::optional<uint64_t> JobRegistry::transferred(const std::string& job_id) const {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = jobs_.find(job_id);
    if (it == jobs_.end()) {
        return std::nullopt;
    }
    return it->second.transferred;
}

bool JobRegistry::contains(const std::string& job_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return jobs_.count(job_id) > 0;
}

size_t JobRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return jobs_.size();
}

std::vector<std::string> JobRegistry::jobIds() const {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<std::string> ids;
    ids.reserve(jobs_.size());
    for (const auto& [id, job] : jobs_) {
        ids.push_back(id);
    }
    return ids;
}

}}
