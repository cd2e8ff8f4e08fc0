#pragma once

#include <string>
#include <cstddef>
#include <cstdint>

namespace ps3_update {
namespace constants {

namespace version {
    constexpr const char* CLI_VERSION = "1.0.0";

    inline std::string getFullVersion() {
        return std::string("PS3 Update Fetcher v") + CLI_VERSION;
    }
}

namespace network {
    constexpr const char* DEFAULT_METADATA_URL = "https://a0.ww.np.dl.playstation.net";
    constexpr const char* METADATA_PATH_PREFIX = "/tpl/np/";
    constexpr const char* METADATA_PATH_SUFFIX = "-ver.xml";
    constexpr const char* USER_AGENT = "ps3-update/1.0";
    constexpr int DEFAULT_TIMEOUT_SECONDS = 60;
    constexpr bool DEFAULT_VERIFY_TLS = false;
}

namespace system {
    constexpr const char* APPLICATION_NAME = "PS3 Update Fetcher";
    constexpr const char* APPLICATION_ID = "ps3-update";
}

namespace metadata {
    constexpr const char* UNKNOWN_VERSION = "Unknown";
    constexpr const char* UNKNOWN_TITLE = "Unknown Title";
    constexpr const char* DEFAULT_FILENAME = "update.pkg";
    constexpr const char* DEFAULT_FOLDER = "PS3Updates";
    constexpr size_t MAX_FOLDER_NAME_LENGTH = 64;
}

namespace transfer {
    constexpr size_t DEFAULT_PARTS = 4;
    constexpr size_t MAX_PARTS = 16;
    constexpr size_t DEFAULT_BUFFER_KB = 256;
    constexpr double MIN_ELAPSED_SECONDS = 0.001;
    constexpr int POLL_INTERVAL_MS = 200;
}

namespace limits {
    constexpr size_t DEFAULT_LOG_ROTATION_SIZE_MB = 10;
    constexpr size_t DEFAULT_LOG_MAX_FILES = 3;
}

namespace config_defaults {
    constexpr int NETWORK_TIMEOUT = network::DEFAULT_TIMEOUT_SECONDS;
    constexpr bool VERIFY_TLS = network::DEFAULT_VERIFY_TLS;

    constexpr bool DOWNLOAD_MULTIPART = true;
    constexpr size_t DOWNLOAD_PARTS = transfer::DEFAULT_PARTS;
    constexpr size_t DOWNLOAD_BUFFER_KB = transfer::DEFAULT_BUFFER_KB;

    constexpr size_t LOG_ROTATION_SIZE_MB = limits::DEFAULT_LOG_ROTATION_SIZE_MB;
    constexpr size_t LOG_MAX_FILES = limits::DEFAULT_LOG_MAX_FILES;
}

}
}
