#include "ps3_update/download/transfer_engine.hpp"
#include "ps3_update/download/byte_range.hpp"
#include "ps3_update/update/error_codes.hpp"
#include "ps3_update/common/format.hpp"
#include "ps3_update/common/logger.hpp"
#include "../network/http_session.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <future>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <vector>

namespace ps3_update {
namespace download {

using update::UpdateError;
using update::UpdateErrorCode;

namespace {

struct Worker {
    std::shared_future<void> future;
    CancellationToken token;
};

void throwIfCancelled(const CancellationToken& token, const std::string& job_id) {
    if (token.isCancelled()) {
        throw UpdateError(UpdateErrorCode::TRANSFER_CANCELLED, job_id);
    }
}

std::string toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

}

class TransferEngine::Impl {
public:
    Impl(JobRegistry& registry, TransferOptions options)
        : registry_(registry), options_(std::move(options)) {}

    ~Impl() {
        std::vector<Worker> pending;
        {
            std::lock_guard<std::mutex> lock(workers_mutex_);
            for (auto& [id, worker] : workers_) {
                worker.token.cancel();
                pending.push_back(worker);
            }
        }

        for (auto& worker : pending) {
            worker.future.wait();
        }
    }

    TransferHandle start(const std::string& url,
                         const std::filesystem::path& destination,
                         common::TransferMode mode) {
        auto parent = destination.parent_path();
        if (!parent.empty()) {
            std::error_code ec;
            std::filesystem::create_directories(parent, ec);
            if (ec) {
                common::Logger::instance().error("[Transfer] Directory create failed | path={} | error={}",
                                                 parent.string(), ec.message());
                throw UpdateError(UpdateErrorCode::FILESYSTEM_ERROR,
                                  "Cannot create " + parent.string() + ": " + ec.message(),
                                  common::ErrorContext{"transfer"}.with("path", parent.string()));
            }
        }

        std::string filename = destination.filename().string();
        if (filename.empty()) {
            filename = constants::metadata::DEFAULT_FILENAME;
        }

        std::string job_id = registry_.create(filename);
        CancellationToken token;

        common::Logger::instance().info("[Transfer] Started | id={} | mode={} | url={} | dest={}",
                                        job_id, common::to_string(mode), url, destination.string());

        auto future = std::async(std::launch::async, [this, url, destination, mode, job_id, token]() {
            run(url, destination, mode, job_id, token);
        }).share();

        {
            std::lock_guard<std::mutex> lock(workers_mutex_);
            pruneFinished();
            workers_[job_id] = Worker{future, token};
        }

        return TransferHandle{job_id, token};
    }

    bool cancel(const std::string& job_id) {
        std::optional<Worker> worker = findWorker(job_id);

        if (worker) {
            worker->token.cancel();
            worker->future.wait();
        }

        registry_.remove(job_id);

        {
            std::lock_guard<std::mutex> lock(workers_mutex_);
            workers_.erase(job_id);
        }

        common::Logger::instance().info("[Transfer] Cancelled | id={} | had_worker={}", job_id, worker.has_value());
        return worker.has_value();
    }

    void wait(const std::string& job_id) {
        if (auto worker = findWorker(job_id)) {
            worker->future.wait();
        }
    }

    bool waitFor(const std::string& job_id, std::chrono::milliseconds timeout) {
        auto worker = findWorker(job_id);
        if (!worker) {
            return true;
        }
        return worker->future.wait_for(timeout) == std::future_status::ready;
    }

    size_t activeTransfers() const {
        std::lock_guard<std::mutex> lock(workers_mutex_);
        return std::count_if(workers_.begin(), workers_.end(), [](const auto& entry) {
            return entry.second.future.wait_for(std::chrono::seconds(0)) != std::future_status::ready;
        });
    }

private:
    JobRegistry& registry_;
    TransferOptions options_;
    mutable std::mutex workers_mutex_;
    std::unordered_map<std::string, Worker> workers_;

    std::optional<Worker> findWorker(const std::string& job_id) const {
        std::lock_guard<std::mutex> lock(workers_mutex_);
        auto it = workers_.find(job_id);
        if (it == workers_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    // Caller holds workers_mutex_.
    void pruneFinished() {
        for (auto it = workers_.begin(); it != workers_.end();) {
            if (it->second.future.wait_for(std::chrono::seconds(0)) == std::future_status::ready) {
                it = workers_.erase(it);
            } else {
                ++it;
            }
        }
    }

    size_t bufferBytes() const {
        return std::max<size_t>(options_.buffer_kb, 1) * 1024;
    }

    void run(const std::string& url,
             const std::filesystem::path& destination,
             common::TransferMode mode,
             const std::string& job_id,
             const CancellationToken& token) {
        auto start_time = std::chrono::steady_clock::now();
        std::optional<std::string> error;

        try {
            network::Url parsed = network::parseUrl(url);

            if (mode.isMultiPart()) {
                bool completed = false;

                try {
                    runMultiPart(parsed, destination, mode.parts, job_id, token);
                    completed = true;
                } catch (const UpdateError& e) {
                    if (e.code() == UpdateErrorCode::TRANSFER_CANCELLED) {
                        throw;
                    }
                    common::Logger::instance().warn("[Transfer] Multipart failed, falling back to direct | id={} | error={} | {}",
                                                    job_id, e.what(), common::formatContext(e.context()));
                } catch (const std::exception& e) {
                    if (token.isCancelled()) {
                        throw;
                    }
                    common::Logger::instance().warn("[Transfer] Multipart failed, falling back to direct | id={} | error={}",
                                                    job_id, e.what());
                }

                if (!completed) {
                    uint64_t credited = registry_.transferred(job_id).value_or(0);
                    runDirect(parsed, destination, job_id, token, credited);
                }
            } else {
                runDirect(parsed, destination, job_id, token, 0);
            }
        } catch (const UpdateError& e) {
            error = e.what();
            common::Logger::instance().error("[Transfer] Failed | id={} | code={} | error={} | {}",
                                             job_id, update::UpdateErrorCodeHelper::toString(e.code()), e.what(),
                                             common::formatContext(e.context()));
        } catch (const std::exception& e) {
            error = e.what();
            common::Logger::instance().error("[Transfer] Failed | id={} | error={}", job_id, e.what());
        }

        registry_.finish(job_id, error);

        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start_time);
        common::Logger::instance().info("[Transfer] Finished | id={} | success={} | duration_ms={}",
                                        job_id, !error.has_value(), elapsed.count());
    }

    // Bytes up to `credited` were already counted by a failed multipart
    // attempt; only bytes past that mark are added so the counter never drops.
    void runDirect(const network::Url& url,
                   const std::filesystem::path& destination,
                   const std::string& job_id,
                   const CancellationToken& token,
                   uint64_t credited) {
        throwIfCancelled(token, job_id);

        auto client = network::makeClient(url, options_.http);

        std::vector<char> buffer(bufferBytes());
        std::ofstream out;
        out.rdbuf()->pubsetbuf(buffer.data(), static_cast<std::streamsize>(buffer.size()));

        int status = 0;
        bool write_failed = false;
        uint64_t received = 0;

        auto response = client->Get(url.path, httplib::Headers{},
            [&](const httplib::Response& res) {
                status = res.status;
                if (!network::isSuccessStatus(status)) {
                    return false;
                }

                uint64_t total = network::parseContentLength(res);
                registry_.setTotal(job_id, total);

                out.open(destination, std::ios::binary | std::ios::trunc);
                if (!out) {
                    write_failed = true;
                    return false;
                }

                common::Logger::instance().debug("[Transfer] Direct stream | id={} | status={} | total={}",
                                                 job_id, status, total);
                return !token.isCancelled();
            },
            [&](const char* data, size_t length) {
                if (token.isCancelled()) {
                    return false;
                }

                out.write(data, static_cast<std::streamsize>(length));
                if (!out) {
                    write_failed = true;
                    return false;
                }

                uint64_t before = received;
                received += length;
                if (received > credited) {
                    registry_.update(job_id, received - std::max(before, credited));
                }
                return true;
            });

        throwIfCancelled(token, job_id);

        if (write_failed) {
            throw UpdateError(UpdateErrorCode::FILESYSTEM_ERROR, "Failed to write " + destination.string());
        }

        if (status != 0 && !network::isSuccessStatus(status)) {
            throw UpdateError(UpdateErrorCode::DOWNLOAD_ERROR, "HTTP error: " + std::to_string(status),
                              common::ErrorContext{"transfer"}.with("host", url.host).with("path", url.path));
        }

        if (!response) {
            throw UpdateError(UpdateErrorCode::NETWORK_ERROR, httplib::to_string(response.error()),
                              common::ErrorContext{"transfer"}.with("host", url.host));
        }

        out.flush();
        if (!out) {
            throw UpdateError(UpdateErrorCode::FILESYSTEM_ERROR, "Failed to flush " + destination.string());
        }
        out.close();

        common::Logger::instance().debug("[Transfer] Direct complete | id={} | bytes={}", job_id, received);
    }

    void runMultiPart(const network::Url& url,
                      const std::filesystem::path& destination,
                      size_t parts,
                      const std::string& job_id,
                      const CancellationToken& token) {
        throwIfCancelled(token, job_id);

        auto client = network::makeClient(url, options_.http);
        auto head = client->Head(url.path);

        if (!head) {
            throw UpdateError(UpdateErrorCode::NETWORK_ERROR, httplib::to_string(head.error()));
        }

        if (!network::isSuccessStatus(head->status)) {
            throw UpdateError(UpdateErrorCode::DOWNLOAD_ERROR,
                              "HEAD request failed: " + std::to_string(head->status));
        }

        uint64_t total = network::parseContentLength(*head);
        if (total == 0) {
            throw UpdateError(UpdateErrorCode::DOWNLOAD_ERROR, "Cannot determine file size",
                              common::ErrorContext{"transfer"}.with("host", url.host).with("path", url.path));
        }

        std::string accept_ranges = toLower(head->get_header_value("Accept-Ranges"));
        if (accept_ranges.find("bytes") == std::string::npos) {
            throw UpdateError(UpdateErrorCode::DOWNLOAD_ERROR, "Server does not support range requests",
                              common::ErrorContext{"transfer"}.with("accept_ranges", accept_ranges));
        }

        registry_.setTotal(job_id, total);

        auto ranges = planRanges(total, parts);
        preallocate(destination, total);

        common::Logger::instance().debug("[Transfer] Multipart plan | id={} | total={} | parts={}",
                                         job_id, total, ranges.size());

        throwIfCancelled(token, job_id);

        // std::async futures join on destruction, so a launch failure still
        // waits for the parts already running before the direct retry.
        std::vector<std::future<void>> futures;
        futures.reserve(ranges.size());
        for (const auto& range : ranges) {
            futures.push_back(std::async(std::launch::async, [this, &url, &destination, &job_id, &token, range]() {
                downloadRange(url, destination, range, job_id, token);
            }));
        }

        size_t failed = 0;
        for (size_t i = 0; i < futures.size(); ++i) {
            try {
                futures[i].get();
            } catch (const std::exception& e) {
                ++failed;
                common::Logger::instance().warn("[Transfer] Part failed | id={} | range={} | error={}",
                                                job_id, ranges[i].header(), e.what());
            }
        }

        throwIfCancelled(token, job_id);

        if (failed > 0) {
            throw UpdateError(UpdateErrorCode::DOWNLOAD_ERROR, "One or more parts failed",
                              common::ErrorContext{"transfer"}.with("failed", std::to_string(failed)));
        }
    }

    void preallocate(const std::filesystem::path& destination, uint64_t total) {
        {
            std::ofstream out(destination, std::ios::binary | std::ios::trunc);
            if (!out) {
                throw UpdateError(UpdateErrorCode::FILESYSTEM_ERROR, "Cannot create " + destination.string());
            }
        }

        std::error_code ec;
        std::filesystem::resize_file(destination, total, ec);
        if (ec) {
            throw UpdateError(UpdateErrorCode::FILESYSTEM_ERROR,
                              "Cannot allocate " + destination.string() + ": " + ec.message());
        }
    }

    // Writes only inside [range.start, range.end]; a server that ignores the
    // Range header and sends more fails the part instead of clobbering others.
    void downloadRange(const network::Url& url,
                       const std::filesystem::path& destination,
                       const ByteRange& range,
                       const std::string& job_id,
                       const CancellationToken& token) {
        auto client = network::makeClient(url, options_.http);

        std::vector<char> buffer(bufferBytes());
        std::fstream out;
        out.rdbuf()->pubsetbuf(buffer.data(), static_cast<std::streamsize>(buffer.size()));

        int status = 0;
        bool write_failed = false;
        bool overflow = false;
        uint64_t received = 0;

        httplib::Headers headers = {{"Range", range.header()}};

        auto response = client->Get(url.path, headers,
            [&](const httplib::Response& res) {
                status = res.status;
                if (status != 200 && status != 206) {
                    return false;
                }

                out.open(destination, std::ios::in | std::ios::out | std::ios::binary);
                if (out) {
                    out.seekp(static_cast<std::streamoff>(range.start));
                }
                if (!out) {
                    write_failed = true;
                    return false;
                }
                return !token.isCancelled();
            },
            [&](const char* data, size_t length) {
                if (token.isCancelled()) {
                    return false;
                }

                if (received + length > range.length()) {
                    overflow = true;
                    return false;
                }

                out.write(data, static_cast<std::streamsize>(length));
                if (!out) {
                    write_failed = true;
                    return false;
                }

                received += length;
                registry_.update(job_id, length);
                return true;
            });

        throwIfCancelled(token, job_id);

        if (write_failed) {
            throw UpdateError(UpdateErrorCode::FILESYSTEM_ERROR, "Failed to write " + destination.string());
        }

        if (overflow) {
            throw UpdateError(UpdateErrorCode::DOWNLOAD_ERROR, "Part returned more data than requested",
                              common::ErrorContext{"transfer"}.with("range", range.header()).with("status", std::to_string(status)));
        }

        if (status != 0 && status != 200 && status != 206) {
            throw UpdateError(UpdateErrorCode::DOWNLOAD_ERROR, "Range request failed: " + std::to_string(status));
        }

        if (!response) {
            throw UpdateError(UpdateErrorCode::NETWORK_ERROR, httplib::to_string(response.error()));
        }

        if (received != range.length()) {
            throw UpdateError(UpdateErrorCode::DOWNLOAD_ERROR,
                              "Part ended early: " + std::to_string(received) + "/" + std::to_string(range.length()));
        }

        out.flush();
        if (!out) {
            throw UpdateError(UpdateErrorCode::FILESYSTEM_ERROR, "Failed to flush " + destination.string());
        }
    }
};

TransferEngine::TransferEngine(JobRegistry& registry, TransferOptions options)
    : pimpl_(std::make_unique<Impl>(registry, std::move(options))) {}

TransferEngine::~TransferEngine() = default;

TransferHandle TransferEngine::start(const std::string& url,
                                     const std::filesystem::path& destination,
                                     common::TransferMode mode) {
    return pimpl_->start(url, destination, mode);
}

bool TransferEngine::cancel(const std::string& job_id) {
    return pimpl_->cancel(job_id);
}

void TransferEngine::wait(const std::string& job_id) {
    pimpl_->wait(job_id);
}

bool TransferEngine::waitFor(const std::string& job_id, std::chrono::milliseconds timeout) {
    return pimpl_->waitFor(job_id, timeout);
}

size_t TransferEngine::activeTransfers() const {
    return pimpl_->activeTransfers();
}

}}
