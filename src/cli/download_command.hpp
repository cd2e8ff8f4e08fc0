#pragma once

#include "main_command.hpp"
#include "ps3_update/common/types.hpp"
#include <CLI/CLI.hpp>
#include <filesystem>
#include <optional>
#include <string>

namespace ps3_update {
namespace cli {

class DownloadCommand : public MainCommand {
public:
    DownloadCommand();
    
    void setup(CLI::App* subcommand);
    int execute();

private:
    std::string target_;
    std::string version_;
    std::string output_;
    size_t parts_ = 0;
    bool direct_ = false;
    bool json_output_ = false;
    
    struct ResolvedTarget {
        std::string url;
        std::filesystem::path destination;
        std::string label;
    };
    
    std::optional<ResolvedTarget> resolve();
    common::TransferMode transferMode() const;
    int runTransfer(const ResolvedTarget& target);
    
    static bool isUrl(const std::string& value);
};

}}
