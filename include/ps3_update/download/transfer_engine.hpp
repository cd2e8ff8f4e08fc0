#pragma once

#include "../common/types.hpp"
#include "../common/constants.hpp"
#include "../network/http_options.hpp"
#include "job_registry.hpp"
#include <atomic>
#include <chrono>
#include <filesystem>
#include <memory>
#include <string>

namespace ps3_update {
namespace download {

class CancellationToken {
public:
    CancellationToken() : flag_(std::make_shared<std::atomic<bool>>(false)) {}
    
    void cancel() const { flag_->store(true); }
    bool isCancelled() const { return flag_->load(); }

private:
    std::shared_ptr<std::atomic<bool>> flag_;
};

struct TransferHandle {
    std::string job_id;
    CancellationToken token;
};

struct TransferOptions {
    network::HttpOptions http;
    size_t buffer_kb = constants::transfer::DEFAULT_BUFFER_KB;
};

class TransferEngine {
public:
    explicit TransferEngine(JobRegistry& registry, TransferOptions options = {});
    ~TransferEngine();
    
    TransferEngine(const TransferEngine&) = delete;
    TransferEngine& operator=(const TransferEngine&) = delete;
    
    // Returns as soon as the job is registered; all network and file I/O runs
    // on a background worker. Throws UpdateError(FILESYSTEM_ERROR) only when
    // the destination's parent directory cannot be created.
    TransferHandle start(const std::string& url,
                         const std::filesystem::path& destination,
                         common::TransferMode mode);
    
    // Signals the worker, waits until it stopped, then drops the job from the
    // registry. Returns false when no worker was known for the id.
    bool cancel(const std::string& job_id);
    
    void wait(const std::string& job_id);
    bool waitFor(const std::string& job_id, std::chrono::milliseconds timeout);
    
    size_t activeTransfers() const;

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

}}
