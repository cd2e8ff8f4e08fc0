#include <CLI/CLI.hpp>
#include <iostream>
#include <memory>

#include "ps3_update/common/config.hpp"
#include "ps3_update/common/constants.hpp"
#include "ps3_update/common/logger.hpp"
#include "cli/config_command.hpp"
#include "cli/download_command.hpp"
#include "cli/fetch_command.hpp"
#include "cli/status_command.hpp"

int main(int argc, char** argv) {
    try {
        CLI::App app{ps3_update::constants::system::APPLICATION_NAME,
                     ps3_update::constants::system::APPLICATION_ID};
        app.set_version_flag("--version,-v", ps3_update::constants::version::getFullVersion());
        app.require_subcommand(0, 1);
        
        std::string config_file;
        bool verbose = false;
        app.add_option("-c,--config", config_file, "Configuration file path");
        app.add_flag("--verbose", verbose, "Enable debug logging");
        
        auto fetch_cmd = std::make_unique<ps3_update::cli::FetchCommand>();
        auto download_cmd = std::make_unique<ps3_update::cli::DownloadCommand>();
        auto status_cmd = std::make_unique<ps3_update::cli::StatusCommand>();
        auto config_cmd = std::make_unique<ps3_update::cli::ConfigCommand>();
        
        fetch_cmd->setup(app.add_subcommand("fetch", "List update packages for title IDs"));
        download_cmd->setup(app.add_subcommand("download", "Download an update package"));
        status_cmd->setup(app.add_subcommand("status", "Check update server reachability"));
        config_cmd->setup(app.add_subcommand("config", "Manage configuration"));
        
        CLI11_PARSE(app, argc, argv);
        
        auto& config = ps3_update::common::Config::instance();
        if (!config.load(config_file)) {
            std::cerr << "Warning: configuration could not be parsed, using defaults\n";
        }
        
        if (verbose) {
            ps3_update::common::Logger::instance().initialize(
                ps3_update::common::LogMode::CONSOLE_ONLY,
                "",
                ps3_update::common::LogLevel::DEBUG,
                config.global().logging
            );
        } else {
            ps3_update::common::Logger::instance().initialize(
                ps3_update::common::LogMode::FILE_ONLY,
                config.global().log_file,
                config.global().log_level,
                config.global().logging
            );
        }
        
        int result = 0;
        if (fetch_cmd->wasCalled()) {
            result = fetch_cmd->execute();
        } else if (download_cmd->wasCalled()) {
            result = download_cmd->execute();
        } else if (status_cmd->wasCalled()) {
            result = status_cmd->execute();
        } else if (config_cmd->wasCalled()) {
            result = config_cmd->execute();
        } else {
            std::cout << app.help() << std::endl;
        }
        
        ps3_update::common::Logger::instance().shutdown();
        return result;
        
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
