#include <catch2/catch_test_macros.hpp>
#include <algorithm>
#include <atomic>
#include <chrono>
#include <fstream>
#include <iterator>
#include <thread>
#include <vector>

#include "ps3_update/download/job_registry.hpp"
#include "ps3_update/download/transfer_engine.hpp"
#include "ps3_update/update/error_codes.hpp"
#include "support/stub_server.hpp"

using namespace ps3_update;
using namespace ps3_update::download;

namespace {

constexpr size_t PAYLOAD_SIZE = 1024 * 1024 + 3;
constexpr size_t SLOW_SIZE = 4 * 1024 * 1024;

std::string makePayload() {
    std::string payload(PAYLOAD_SIZE, '\0');
    for (size_t i = 0; i < payload.size(); ++i) {
        payload[i] = static_cast<char>((i * 31 + 7) % 251);
    }
    return payload;
}

std::string readFile(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

TransferOptions testOptions() {
    TransferOptions options;
    options.http.timeout_seconds = 5;
    options.buffer_kb = 64;
    return options;
}

bool isFirstRange(const httplib::Request& req) {
    return req.get_header_value("Range").rfind("bytes=0-", 0) == 0;
}

void serveSlow(testing::StubServer& stub) {
    stub.server().Get("/slow.pkg", [](const httplib::Request&, httplib::Response& res) {
        res.set_content_provider(SLOW_SIZE, "application/octet-stream",
            [](size_t, size_t length, httplib::DataSink& sink) {
                std::this_thread::sleep_for(std::chrono::milliseconds(10));
                std::string chunk(std::min<size_t>(length, 16 * 1024), 'x');
                sink.write(chunk.data(), chunk.size());
                return true;
            });
    });
}

void waitForFirstBytes(const JobRegistry& registry, const std::string& job_id) {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (registry.transferred(job_id).value_or(0) == 0 &&
           std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
}

}

TEST_CASE("Transfers against a stub server", "[transfer][network]") {
    const std::string payload = makePayload();
    std::atomic<int> range_requests{0};
    
    testing::StubServer stub;
    stub.server().Get("/ranged/file.pkg", [&](const httplib::Request& req, httplib::Response& res) {
        if (req.has_header("Range")) {
            ++range_requests;
        }
        res.set_header("Accept-Ranges", "bytes");
        res.set_content(payload, "application/octet-stream");
    });
    stub.server().Get("/norange/file.pkg", [&](const httplib::Request&, httplib::Response& res) {
        res.set_header("Accept-Ranges", "none");
        res.set_content(payload, "application/octet-stream");
    });
    stub.server().Get("/flaky/file.pkg", [&](const httplib::Request& req, httplib::Response& res) {
        if (req.has_header("Range") && isFirstRange(req)) {
            res.status = 500;
            return;
        }
        res.set_header("Accept-Ranges", "bytes");
        res.set_content(payload, "application/octet-stream");
    });
    stub.server().Get("/broken/file.pkg", [&](const httplib::Request& req, httplib::Response& res) {
        if (req.method == "HEAD") {
            res.set_header("Accept-Ranges", "bytes");
            res.set_content(payload, "application/octet-stream");
            return;
        }
        res.status = 503;
    });
    stub.server().Get("/chunked/file.pkg", [&](const httplib::Request&, httplib::Response& res) {
        res.set_header("Accept-Ranges", "bytes");
        res.set_chunked_content_provider("application/octet-stream",
            [&](size_t offset, httplib::DataSink& sink) {
                if (offset >= payload.size()) {
                    sink.done();
                    return true;
                }
                size_t length = std::min<size_t>(payload.size() - offset, 64 * 1024);
                sink.write(payload.data() + offset, length);
                return true;
            });
    });
    stub.server().Get("/whole/file.pkg", [&](const httplib::Request& req, httplib::Response& res) {
        res.set_header("Accept-Ranges", "bytes");
        if (!req.has_header("Range")) {
            res.set_content(payload, "application/octet-stream");
            return;
        }
        // An explicit 200 keeps httplib from slicing the body to the range.
        ++range_requests;
        res.set_content(payload, "application/octet-stream");
        res.status = 200;
    });
    stub.start();
    
    testing::TempDir dir;
    JobRegistry registry;
    TransferEngine engine(registry, testOptions());
    
    SECTION("Direct transfer streams the whole body") {
        auto destination = dir.path() / "direct" / "file.pkg";
        auto handle = engine.start(stub.baseUrl() + "/ranged/file.pkg", destination,
                                   common::TransferMode::direct());
        engine.wait(handle.job_id);
        
        auto snapshot = registry.snapshot(handle.job_id);
        REQUIRE(snapshot.done);
        REQUIRE_FALSE(snapshot.error.has_value());
        REQUIRE(snapshot.filename == "file.pkg");
        REQUIRE(snapshot.total == PAYLOAD_SIZE);
        REQUIRE(snapshot.transferred == PAYLOAD_SIZE);
        REQUIRE(snapshot.percent == 100.0);
        REQUIRE(readFile(destination) == payload);
        REQUIRE(range_requests.load() == 0);
    }
    
    SECTION("Multipart transfer assembles the ranges") {
        auto destination = dir.path() / "a" / "b" / "file.pkg";
        auto handle = engine.start(stub.baseUrl() + "/ranged/file.pkg", destination,
                                   common::TransferMode::multiPart(4));
        engine.wait(handle.job_id);
        
        auto snapshot = registry.snapshot(handle.job_id);
        REQUIRE(snapshot.done);
        REQUIRE_FALSE(snapshot.error.has_value());
        REQUIRE(snapshot.total == PAYLOAD_SIZE);
        REQUIRE(snapshot.transferred == PAYLOAD_SIZE);
        REQUIRE(range_requests.load() == 4);
        REQUIRE(std::filesystem::file_size(destination) == PAYLOAD_SIZE);
        REQUIRE(readFile(destination) == payload);
    }
    
    SECTION("Server without range support falls back to direct") {
        auto destination = dir.path() / "file.pkg";
        auto handle = engine.start(stub.baseUrl() + "/norange/file.pkg", destination,
                                   common::TransferMode::multiPart(4));
        engine.wait(handle.job_id);
        
        auto snapshot = registry.snapshot(handle.job_id);
        REQUIRE(snapshot.done);
        REQUIRE_FALSE(snapshot.error.has_value());
        REQUIRE(snapshot.transferred == PAYLOAD_SIZE);
        REQUIRE(readFile(destination) == payload);
    }
    
    SECTION("Unknown size falls back to direct") {
        auto destination = dir.path() / "file.pkg";
        auto handle = engine.start(stub.baseUrl() + "/chunked/file.pkg", destination,
                                   common::TransferMode::multiPart(4));
        engine.wait(handle.job_id);
        
        auto snapshot = registry.snapshot(handle.job_id);
        REQUIRE(snapshot.done);
        REQUIRE_FALSE(snapshot.error.has_value());
        REQUIRE(snapshot.total == 0);
        REQUIRE(snapshot.transferred == PAYLOAD_SIZE);
        REQUIRE(readFile(destination) == payload);
    }
    
    SECTION("Part answered with the whole body falls back to direct") {
        auto destination = dir.path() / "file.pkg";
        auto handle = engine.start(stub.baseUrl() + "/whole/file.pkg", destination,
                                   common::TransferMode::multiPart(4));
        engine.wait(handle.job_id);
        
        auto snapshot = registry.snapshot(handle.job_id);
        REQUIRE(snapshot.done);
        REQUIRE_FALSE(snapshot.error.has_value());
        REQUIRE(snapshot.total == PAYLOAD_SIZE);
        REQUIRE(snapshot.transferred == PAYLOAD_SIZE);
        REQUIRE(range_requests.load() == 4);
        REQUIRE(std::filesystem::file_size(destination) == PAYLOAD_SIZE);
        REQUIRE(readFile(destination) == payload);
    }
    
    SECTION("Failed part falls back with a monotonic counter") {
        auto destination = dir.path() / "file.pkg";
        auto handle = engine.start(stub.baseUrl() + "/flaky/file.pkg", destination,
                                   common::TransferMode::multiPart(4));
        
        std::vector<uint64_t> samples;
        while (!engine.waitFor(handle.job_id, std::chrono::milliseconds(1))) {
            if (auto transferred = registry.transferred(handle.job_id)) {
                samples.push_back(*transferred);
            }
        }
        
        REQUIRE(std::is_sorted(samples.begin(), samples.end()));
        
        auto snapshot = registry.snapshot(handle.job_id);
        REQUIRE(snapshot.done);
        REQUIRE_FALSE(snapshot.error.has_value());
        REQUIRE(snapshot.transferred == PAYLOAD_SIZE);
        REQUIRE(readFile(destination) == payload);
    }
    
    SECTION("Fallback failure is reported on the job") {
        auto destination = dir.path() / "file.pkg";
        auto handle = engine.start(stub.baseUrl() + "/broken/file.pkg", destination,
                                   common::TransferMode::multiPart(2));
        engine.wait(handle.job_id);
        
        auto snapshot = registry.snapshot(handle.job_id);
        REQUIRE(snapshot.done);
        REQUIRE(snapshot.error.has_value());
        REQUIRE(snapshot.error->find("HTTP error: 503") != std::string::npos);
    }
    
    SECTION("Missing file is an HTTP error on the job") {
        auto handle = engine.start(stub.baseUrl() + "/missing.pkg", dir.path() / "missing.pkg",
                                   common::TransferMode::direct());
        engine.wait(handle.job_id);
        
        auto snapshot = registry.snapshot(handle.job_id);
        REQUIRE(snapshot.done);
        REQUIRE(snapshot.error.has_value());
        REQUIRE(snapshot.error->find("HTTP error: 404") != std::string::npos);
    }
    
    SECTION("Malformed URL is reported on the job, not thrown") {
        auto handle = engine.start("ftp://example.com/file.pkg", dir.path() / "file.pkg",
                                   common::TransferMode::direct());
        engine.wait(handle.job_id);
        
        auto snapshot = registry.snapshot(handle.job_id);
        REQUIRE(snapshot.done);
        REQUIRE(snapshot.error.has_value());
    }
    
    SECTION("Unwritable parent directory throws on start") {
        auto blocker = dir.path() / "blocker";
        std::ofstream(blocker) << "x";
        
        try {
            engine.start(stub.baseUrl() + "/ranged/file.pkg", blocker / "sub" / "file.pkg",
                         common::TransferMode::direct());
            FAIL("expected FILESYSTEM_ERROR");
        } catch (const update::UpdateError& e) {
            REQUIRE(e.code() == update::UpdateErrorCode::FILESYSTEM_ERROR);
        }
        REQUIRE(registry.size() == 0);
    }
}

TEST_CASE("Cancelling a transfer", "[transfer][network][cancel]") {
    testing::StubServer stub;
    serveSlow(stub);
    stub.start();
    
    testing::TempDir dir;
    JobRegistry registry;
    TransferEngine engine(registry, testOptions());
    
    auto destination = dir.path() / "slow.pkg";
    auto handle = engine.start(stub.baseUrl() + "/slow.pkg", destination, common::TransferMode::direct());
    
    waitForFirstBytes(registry, handle.job_id);
    REQUIRE(registry.transferred(handle.job_id).value_or(0) > 0);
    
    REQUIRE(engine.cancel(handle.job_id));
    REQUIRE(handle.token.isCancelled());
    REQUIRE_FALSE(registry.contains(handle.job_id));
    REQUIRE(engine.activeTransfers() == 0);
    
    try {
        registry.snapshot(handle.job_id);
        FAIL("expected JOB_NOT_FOUND");
    } catch (const update::UpdateError& e) {
        REQUIRE(e.code() == update::UpdateErrorCode::JOB_NOT_FOUND);
    }
    
    SECTION("Unknown ids are harmless") {
        REQUIRE_FALSE(engine.cancel("ffffffffffffffff"));
        engine.wait("ffffffffffffffff");
        REQUIRE(engine.waitFor("ffffffffffffffff", std::chrono::milliseconds(1)));
    }
}

TEST_CASE("Start returns before the transfer completes", "[transfer][network]") {
    testing::StubServer stub;
    serveSlow(stub);
    stub.start();
    
    testing::TempDir dir;
    JobRegistry registry;
    
    std::string job_id;
    {
        TransferEngine engine(registry, testOptions());
        auto handle = engine.start(stub.baseUrl() + "/slow.pkg", dir.path() / "slow.pkg",
                                   common::TransferMode::direct());
        job_id = handle.job_id;
        
        REQUIRE(registry.contains(job_id));
        REQUIRE_FALSE(registry.snapshot(job_id).done);
        REQUIRE(engine.activeTransfers() == 1);
    }
    
    // Engine teardown cancels and joins the worker; the job stays observable.
    auto snapshot = registry.snapshot(job_id);
    REQUIRE(snapshot.done);
    REQUIRE(snapshot.error.has_value());
    REQUIRE(snapshot.transferred < SLOW_SIZE);
}

TEST_CASE("Removing a job while its transfer runs", "[transfer][network]") {
    testing::StubServer stub;
    serveSlow(stub);
    stub.start();
    
    testing::TempDir dir;
    JobRegistry registry;
    TransferEngine engine(registry, testOptions());
    
    auto destination = dir.path() / "slow.pkg";
    auto handle = engine.start(stub.baseUrl() + "/slow.pkg", destination, common::TransferMode::direct());
    
    waitForFirstBytes(registry, handle.job_id);
    REQUIRE(registry.transferred(handle.job_id).value_or(0) > 0);
    
    registry.remove(handle.job_id);
    REQUIRE_FALSE(registry.contains(handle.job_id));
    REQUIRE_FALSE(registry.transferred(handle.job_id).has_value());
    
    engine.wait(handle.job_id);
    
    REQUIRE_FALSE(handle.token.isCancelled());
    REQUIRE(registry.size() == 0);
    REQUIRE(engine.activeTransfers() == 0);
    REQUIRE(std::filesystem::file_size(destination) == SLOW_SIZE);
    
    try {
        registry.snapshot(handle.job_id);
        FAIL("expected JOB_NOT_FOUND");
    } catch (const update::UpdateError& e) {
        REQUIRE(e.code() == update::UpdateErrorCode::JOB_NOT_FOUND);
    }
}
