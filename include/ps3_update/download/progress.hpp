#pragma once

#include "../common/types.hpp"
#include <chrono>
#include <string>

namespace ps3_update {
namespace download {

class JobRegistry;

// Percent is not clamped: a counter that overshoots the declared total shows above 100.
common::ProgressSnapshot computeSnapshot(const common::TransferJob& job,
                                         std::chrono::steady_clock::time_point now);

class ProgressReporter {
public:
    explicit ProgressReporter(const JobRegistry& registry);
    
    // Throws UpdateError(JOB_NOT_FOUND).
    common::ProgressSnapshot snapshot(const std::string& job_id) const;
    
    bool isFinished(const std::string& job_id) const;

private:
    const JobRegistry& registry_;
};

}}
