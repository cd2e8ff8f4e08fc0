#pragma once

#include "network/http_session.hpp"
#include <chrono>
#include <filesystem>
#include <random>
#include <string>
#include <thread>

namespace ps3_update {
namespace testing {

// Local httplib server on an ephemeral port, listening on a background thread.
class StubServer {
public:
    StubServer() {
        port_ = server_.bind_to_any_port("127.0.0.1");
    }
    
    ~StubServer() { stop(); }
    
    httplib::Server& server() { return server_; }
    
    void start() {
        thread_ = std::thread([this]() { server_.listen_after_bind(); });
        while (!server_.is_running()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
    }
    
    void stop() {
        if (thread_.joinable()) {
            server_.stop();
            thread_.join();
        }
    }
    
    std::string baseUrl() const { return "http://127.0.0.1:" + std::to_string(port_); }

private:
    httplib::Server server_;
    std::thread thread_;
    int port_ = 0;
};

class TempDir {
public:
    TempDir() {
        std::random_device device;
        path_ = std::filesystem::temp_directory_path() /
                ("ps3_update_test_" + std::to_string(device()) + std::to_string(device()));
        std::filesystem::create_directories(path_);
    }
    
    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }
    
    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
};

}}
