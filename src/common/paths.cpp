#include "ps3_update/common/paths.hpp"
#include "ps3_update/common/constants.hpp"
#include <unistd.h>
#include <filesystem>
#include <cstdlib>
#include <cstring>

namespace ps3_update {
namespace common {

PathManager& PathManager::instance() {
    static PathManager instance;
    return instance;
}

PathManager::PathManager() {
    mode_ = detectMode();
}

InstallMode PathManager::detectMode() {
    if (std::getenv("PS3_UPDATE_PORTABLE")) {
        return InstallMode::PORTABLE;
    }

    const char* home = std::getenv("HOME");
    if (home && strlen(home) > 0) {
        return InstallMode::USER;
    }

    return InstallMode::PORTABLE;
}

std::vector<std::string> PathManager::getConfigSearchPaths() const {
    std::vector<std::string> paths;

    if (const char* env = std::getenv("PS3_UPDATE_CONFIG")) {
        paths.push_back(env);
    }

    paths.push_back(getConfigFile());

    return paths;
}

std::string PathManager::getConfigDir() const {
    switch (mode_) {
        case InstallMode::USER:
            return getXdgConfigHome() + "/" + constants::system::APPLICATION_ID;
        case InstallMode::PORTABLE:
            return "./config";
    }
    return "";
}

std::string PathManager::getLogDir() const {
    switch (mode_) {
        case InstallMode::USER:
            return getXdgStateHome() + "/" + constants::system::APPLICATION_ID;
        case InstallMode::PORTABLE:
            return "./logs";
    }
    return "";
}

std::string PathManager::getDownloadDir() const {
    switch (mode_) {
        case InstallMode::USER: {
            std::string downloads = getXdgDownloadDir();
            if (!downloads.empty()) {
                return downloads;
            }
            return ".";
        }
        case InstallMode::PORTABLE:
            return "./downloads";
    }
    return ".";
}

std::string PathManager::getConfigFile() const {
    return getConfigDir() + "/" + constants::system::APPLICATION_ID + ".conf";
}

std::string PathManager::getLogFile() const {
    return getLogDir() + "/" + constants::system::APPLICATION_ID + ".log";
}

std::string PathManager::getXdgConfigHome() const {
    const char* xdg = std::getenv("XDG_CONFIG_HOME");
    if (xdg && strlen(xdg) > 0) {
        return xdg;
    }
    const char* home = std::getenv("HOME");
    return home ? std::string(home) + "/.config" : "";
}

std::string PathManager::getXdgStateHome() const {
    const char* xdg = std::getenv("XDG_STATE_HOME");
    if (xdg && strlen(xdg) > 0) {
        return xdg;
    }
    const char* home = std::getenv("HOME");
    return home ? std::string(home) + "/.local/state" : "";
}

std::string PathManager::getXdgDownloadDir() const {
    const char* xdg = std::getenv("XDG_DOWNLOAD_DIR");
    if (xdg && strlen(xdg) > 0) {
        return xdg;
    }
    const char* home = std::getenv("HOME");
    return home ? std::string(home) + "/Downloads" : "";
}

}}
