#include "status_command.hpp"
#include "ps3_update/common/config.hpp"
#include "ps3_update/update/fetcher.hpp"
#include <iostream>

namespace ps3_update {
namespace cli {

StatusCommand::StatusCommand() = default;

void StatusCommand::setup(CLI::App* subcommand) {
    subcommand_ = subcommand;
    subcommand->callback([this]() { was_called_ = true; });
}

int StatusCommand::execute() {
    const auto& config = common::Config::instance().global();
    update::MetadataFetcher fetcher(config.network.metadata_url, httpOptions());
    
    bool colors = useColors();
    std::cout << "Update server: " << fetcher.baseUrl() << "\n";
    
    if (fetcher.checkServerStatus()) {
        std::cout << "Status: " << (colors ? "\033[32mreachable\033[0m" : "reachable") << "\n";
        return 0;
    }
    
    std::cout << "Status: " << (colors ? "\033[31munreachable\033[0m" : "unreachable") << "\n";
    return 1;
}

}}
