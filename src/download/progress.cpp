#include "ps3_update/download/progress.hpp"
#include "ps3_update/download/job_registry.hpp"
#include "ps3_update/common/constants.hpp"
#include "ps3_update/common/format.hpp"
#include <algorithm>

namespace ps3_update {
namespace download {

common::ProgressSnapshot computeSnapshot(const common::TransferJob& job,
                                         std::chrono::steady_clock::time_point now) {
    common::ProgressSnapshot snapshot;
    snapshot.job_id = job.id;
    snapshot.filename = job.filename;
    snapshot.total = job.total;
    snapshot.transferred = job.transferred;
    snapshot.done = job.done;
    snapshot.error = job.error;

    if (job.total > 0) {
        snapshot.percent = 100.0 * static_cast<double>(job.transferred) / static_cast<double>(job.total);
    }

    double elapsed = std::chrono::duration<double>(now - job.created).count();
    elapsed = std::max(elapsed, constants::transfer::MIN_ELAPSED_SECONDS);

    snapshot.bytes_per_second = static_cast<double>(job.transferred) / elapsed;
    snapshot.throughput_human = common::formatRate(snapshot.bytes_per_second);

    return snapshot;
}

ProgressReporter::ProgressReporter(const JobRegistry& registry)
    : registry_(registry) {}

common::ProgressSnapshot ProgressReporter::snapshot(const std::string& job_id) const {
    return registry_.snapshot(job_id);
}

bool ProgressReporter::isFinished(const std::string& job_id) const {
    return registry_.snapshot(job_id).done;
}

}}
