#pragma once

#include <string>
#include <vector>

namespace ps3_update {
namespace common {

enum class InstallMode {
    USER,
    PORTABLE
};

class PathManager {
public:
    static PathManager& instance();
    
    InstallMode detectMode();
    
    std::string getConfigDir() const;
    std::string getLogDir() const;
    std::string getDownloadDir() const;
    
    std::string getConfigFile() const;
    std::string getLogFile() const;
    std::vector<std::string> getConfigSearchPaths() const;
    
    bool isUserMode() const { return mode_ == InstallMode::USER; }
    
private:
    PathManager();
    InstallMode mode_;
    
    std::string getXdgConfigHome() const;
    std::string getXdgStateHome() const;
    std::string getXdgDownloadDir() const;
};

}}
