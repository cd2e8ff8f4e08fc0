#pragma once

#include <string>
#include <map>
#include <optional>
#include <cstdint>

namespace ps3_update {
namespace common {

enum class LogLevel {
    ERROR = 0,
    WARN = 1,
    INFO = 2,
    DEBUG = 3
};

enum class LogFormat {
    TEXT,
    JSON
};

struct LoggingConfig {
    size_t rotation_size_mb;
    size_t max_files;
    LogFormat format;
};

struct NetworkConfig {
    std::string metadata_url;
    int timeout;
    bool verify_tls;
    std::string user_agent;
};

struct DownloadConfig {
    std::string download_dir;
    bool multipart;
    size_t parts;
    size_t buffer_kb;
};

struct GlobalConfig {
    std::string log_file;
    LogLevel log_level;
    NetworkConfig network;
    DownloadConfig download;
    LoggingConfig logging;
};

class Config {
public:
    static Config& instance();

    bool load(const std::string& config_file = "");
    bool save(const std::string& config_file = "");
    bool exists() const;

    const GlobalConfig& global() const { return global_; }
    GlobalConfig& global() { return global_; }

    bool setValue(const std::string& key, const std::string& value);
    std::optional<std::string> getValue(const std::string& key) const;
    std::map<std::string, std::string> allValues() const;

    std::optional<std::string> findBestConfig() const;
    std::string getConfigPath() const;

    static GlobalConfig createDefaultConfig();

private:
    Config();
    GlobalConfig global_;
    std::string current_config_path_;

    void applyPathDefaults();
    bool tryLoadTomlFile(const std::string& path, const std::string& description);
};

std::string to_string(LogLevel level);
std::optional<LogLevel> parseLogLevel(const std::string& value);

}}
