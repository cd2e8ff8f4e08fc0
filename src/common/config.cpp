#include "ps3_update/common/config.hpp"
#include "ps3_update/common/constants.hpp"
#include "ps3_update/common/paths.hpp"
#include "ps3_update/common/logger.hpp"
#include <toml.hpp>
#include <fstream>
#include <filesystem>
#include <unistd.h>

namespace ps3_update {
namespace common {

namespace {

bool parseBool(const std::string& value) {
    return value == "true" || value == "1" || value == "yes";
}

}

std::string to_string(LogLevel level) {
    switch (level) {
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::WARN: return "WARN";
        case LogLevel::INFO: return "INFO";
        case LogLevel::DEBUG: return "DEBUG";
    }
    return "INFO";
}

std::optional<LogLevel> parseLogLevel(const std::string& value) {
    if (value == "DEBUG") return LogLevel::DEBUG;
    if (value == "INFO") return LogLevel::INFO;
    if (value == "WARN") return LogLevel::WARN;
    if (value == "ERROR") return LogLevel::ERROR;
    return std::nullopt;
}

Config& Config::instance() {
    static Config instance;
    return instance;
}

Config::Config() {
    global_ = createDefaultConfig();
}

GlobalConfig Config::createDefaultConfig() {
    using namespace constants::config_defaults;

    GlobalConfig config;

    config.log_file = "";
    config.log_level = LogLevel::INFO;

    config.network.metadata_url = constants::network::DEFAULT_METADATA_URL;
    config.network.timeout = NETWORK_TIMEOUT;
    config.network.verify_tls = VERIFY_TLS;
    config.network.user_agent = constants::network::USER_AGENT;

    config.download.download_dir = "";
    config.download.multipart = DOWNLOAD_MULTIPART;
    config.download.parts = DOWNLOAD_PARTS;
    config.download.buffer_kb = DOWNLOAD_BUFFER_KB;

    config.logging.rotation_size_mb = LOG_ROTATION_SIZE_MB;
    config.logging.max_files = LOG_MAX_FILES;
    config.logging.format = LogFormat::TEXT;

    return config;
}

void Config::applyPathDefaults() {
    auto& path_manager = PathManager::instance();

    global_.log_file = path_manager.getLogFile();
    global_.download.download_dir = path_manager.getDownloadDir();
}

std::optional<std::string> Config::findBestConfig() const {
    auto paths = PathManager::instance().getConfigSearchPaths();

    for (const auto& path : paths) {
        if (std::filesystem::exists(path) && access(path.c_str(), R_OK) == 0) {
            return path;
        }
    }

    return std::nullopt;
}

bool Config::load(const std::string& config_file) {
    try {
        global_ = createDefaultConfig();
        applyPathDefaults();

        std::string effective_config_file = config_file;
        if (effective_config_file.empty()) {
            auto best = findBestConfig();
            effective_config_file = best ? *best : PathManager::instance().getConfigFile();
        }

        current_config_path_ = effective_config_file;

        bool loaded = tryLoadTomlFile(effective_config_file, "main config");

        Logger::instance().debug("[Config] Loaded | path={} | from_file={}",
                                 effective_config_file, loaded);
        return true;
    } catch (const std::exception& e) {
        Logger::instance().error("[Config] Parse failed | error={}", e.what());
        return false;
    }
}

bool Config::tryLoadTomlFile(const std::string& path, const std::string& description) {
    if (!std::filesystem::exists(path)) {
        Logger::instance().debug("[Config] {} not found | path={}", description, path);
        return false;
    }

    if (access(path.c_str(), R_OK) != 0) {
        Logger::instance().debug("[Config] {} not readable | path={}", description, path);
        return false;
    }

    try {
        auto data = toml::parse(path);

        if (data.contains("global")) {
            auto global_section = data.at("global");

            if (global_section.contains("log_file")) {
                global_.log_file = toml::find<std::string>(global_section, "log_file");
            }
            if (global_section.contains("log_level")) {
                auto level = parseLogLevel(toml::find<std::string>(global_section, "log_level"));
                if (level) global_.log_level = *level;
            }
        }

        if (data.contains("network")) {
            auto network_section = data.at("network");

            if (network_section.contains("metadata_url")) {
                global_.network.metadata_url = toml::find<std::string>(network_section, "metadata_url");
            }
            if (network_section.contains("timeout")) {
                global_.network.timeout = toml::find<int>(network_section, "timeout");
            }
            if (network_section.contains("verify_tls")) {
                global_.network.verify_tls = toml::find<bool>(network_section, "verify_tls");
            }
            if (network_section.contains("user_agent")) {
                global_.network.user_agent = toml::find<std::string>(network_section, "user_agent");
            }
        }

        if (data.contains("download")) {
            auto download_section = data.at("download");

            if (download_section.contains("download_dir")) {
                global_.download.download_dir = toml::find<std::string>(download_section, "download_dir");
            }
            if (download_section.contains("multipart")) {
                global_.download.multipart = toml::find<bool>(download_section, "multipart");
            }
            if (download_section.contains("parts")) {
                global_.download.parts = toml::find<size_t>(download_section, "parts");
            }
            if (download_section.contains("buffer_kb")) {
                global_.download.buffer_kb = toml::find<size_t>(download_section, "buffer_kb");
            }
        }

        if (data.contains("logging")) {
            auto logging_section = data.at("logging");

            if (logging_section.contains("rotation_size_mb")) {
                global_.logging.rotation_size_mb = toml::find<size_t>(logging_section, "rotation_size_mb");
            }
            if (logging_section.contains("max_files")) {
                global_.logging.max_files = toml::find<size_t>(logging_section, "max_files");
            }
            if (logging_section.contains("format")) {
                std::string format = toml::find<std::string>(logging_section, "format");
                global_.logging.format = (format == "json") ? LogFormat::JSON : LogFormat::TEXT;
            }
        }

        Logger::instance().info("[Config] {} loaded | path={}", description, path);
        return true;
    } catch (const std::exception& e) {
        Logger::instance().warn("[Config] {} parse failed | path={} | error={}",
                                description, path, e.what());
        return false;
    }
}

bool Config::save(const std::string& config_file) {
    try {
        std::string effective_config_file = config_file;
        if (effective_config_file.empty()) {
            effective_config_file = getConfigPath();
        }

        toml::value data = toml::table{
            {"global", toml::table{
                {"log_file", global_.log_file},
                {"log_level", to_string(global_.log_level)}
            }},
            {"network", toml::table{
                {"metadata_url", global_.network.metadata_url},
                {"timeout", global_.network.timeout},
                {"verify_tls", global_.network.verify_tls},
                {"user_agent", global_.network.user_agent}
            }},
            {"download", toml::table{
                {"download_dir", global_.download.download_dir},
                {"multipart", global_.download.multipart},
                {"parts", global_.download.parts},
                {"buffer_kb", global_.download.buffer_kb}
            }},
            {"logging", toml::table{
                {"rotation_size_mb", global_.logging.rotation_size_mb},
                {"max_files", global_.logging.max_files},
                {"format", global_.logging.format == LogFormat::JSON ? "json" : "text"}
            }}
        };

        std::filesystem::path parent = std::filesystem::path(effective_config_file).parent_path();
        if (!parent.empty()) {
            std::error_code ec;
            std::filesystem::create_directories(parent, ec);
            if (ec) {
                Logger::instance().error("[Config] Directory create failed | path={} | error={}",
                                         parent.string(), ec.message());
                return false;
            }
        }

        std::ofstream file(effective_config_file);
        if (!file) {
            Logger::instance().error("[Config] File open failed | path={}", effective_config_file);
            return false;
        }

        file << toml::format(data);
        file.close();

        current_config_path_ = effective_config_file;

        Logger::instance().info("[Config] Saved | path={}", effective_config_file);
        return true;
    } catch (const std::exception& e) {
        Logger::instance().error("[Config] Save failed | error={}", e.what());
        return false;
    }
}

bool Config::exists() const {
    return std::filesystem::exists(getConfigPath());
}

bool Config::setValue(const std::string& key, const std::string& value) {
    try {
        if (key == "log_file") global_.log_file = value;
        else if (key == "log_level") {
            auto level = parseLogLevel(value);
            if (!level) return false;
            global_.log_level = *level;
        }
        else if (key == "network.metadata_url") global_.network.metadata_url = value;
        else if (key == "network.timeout") global_.network.timeout = std::stoi(value);
        else if (key == "network.verify_tls") global_.network.verify_tls = parseBool(value);
        else if (key == "network.user_agent") global_.network.user_agent = value;
        else if (key == "download.download_dir") global_.download.download_dir = value;
        else if (key == "download.multipart") global_.download.multipart = parseBool(value);
        else if (key == "download.parts") global_.download.parts = std::stoull(value);
        else if (key == "download.buffer_kb") global_.download.buffer_kb = std::stoull(value);
        else if (key == "logging.rotation_size_mb") global_.logging.rotation_size_mb = std::stoull(value);
        else if (key == "logging.max_files") global_.logging.max_files = std::stoull(value);
        else if (key == "logging.format") {
            global_.logging.format = (value == "json") ? LogFormat::JSON : LogFormat::TEXT;
        }
        else return false;
    } catch (const std::exception& e) {
        Logger::instance().warn("[Config] Invalid value | key={} | value={} | error={}", key, value, e.what());
        return false;
    }

    return true;
}

std::optional<std::string> Config::getValue(const std::string& key) const {
    if (key == "log_file") return global_.log_file;
    else if (key == "log_level") return to_string(global_.log_level);
    else if (key == "network.metadata_url") return global_.network.metadata_url;
    else if (key == "network.timeout") return std::to_string(global_.network.timeout);
    else if (key == "network.verify_tls") return global_.network.verify_tls ? "true" : "false";
    else if (key == "network.user_agent") return global_.network.user_agent;
    else if (key == "download.download_dir") return global_.download.download_dir;
    else if (key == "download.multipart") return global_.download.multipart ? "true" : "false";
    else if (key == "download.parts") return std::to_string(global_.download.parts);
    else if (key == "download.buffer_kb") return std::to_string(global_.download.buffer_kb);
    else if (key == "logging.rotation_size_mb") return std::to_string(global_.logging.rotation_size_mb);
    else if (key == "logging.max_files") return std::to_string(global_.logging.max_files);
    else if (key == "logging.format") return global_.logging.format == LogFormat::JSON ? "json" : "text";

    return std::nullopt;
}

std::map<std::string, std::string> Config::allValues() const {
    static const char* keys[] = {
        "log_file", "log_level",
        "network.metadata_url", "network.timeout", "network.verify_tls", "network.user_agent",
        "download.download_dir", "download.multipart", "download.parts", "download.buffer_kb",
        "logging.rotation_size_mb", "logging.max_files", "logging.format"
    };

    std::map<std::string, std::string> values;
    for (const char* key : keys) {
        if (auto value = getValue(key)) {
            values[key] = *value;
        }
    }
    return values;
}

std::string Config::getConfigPath() const {
    if (!current_config_path_.empty()) {
        return current_config_path_;
    }
    return PathManager::instance().getConfigFile();
}

}}
