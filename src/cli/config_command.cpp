#include "config_command.hpp"
#include "ps3_update/common/config.hpp"
#include "ps3_update/common/logger.hpp"
#include <iostream>
#include <fstream>
#include <filesystem>
#include <unistd.h>

namespace ps3_update {
namespace cli {

ConfigCommand::ConfigCommand() = default;

void ConfigCommand::setup(CLI::App* subcommand) {
    subcommand_ = subcommand;
    
    set_cmd_ = subcommand->add_subcommand("set", "Set configuration value");
    set_cmd_->add_option("key", set_key_, "Configuration key (e.g. download.parts)")->required();
    set_cmd_->add_option("value", set_value_, "Configuration value")->required();
    set_cmd_->callback([this]() { was_called_ = true; });
    
    get_cmd_ = subcommand->add_subcommand("get", "Get configuration value");
    get_cmd_->add_option("key", get_key_, "Configuration key (optional)");
    get_cmd_->callback([this]() { was_called_ = true; });
    
    show_cmd_ = subcommand->add_subcommand("show", "Show configuration file");
    show_cmd_->callback([this]() { was_called_ = true; });
    
    subcommand->callback([this]() { was_called_ = true; });
}

int ConfigCommand::execute() {
    if (set_cmd_->parsed()) {
        return executeSet();
    } else if (get_cmd_->parsed()) {
        return executeGet();
    } else if (show_cmd_->parsed()) {
        return executeShow();
    }
    
    std::cout << subcommand_->help() << std::endl;
    return 0;
}

int ConfigCommand::executeSet() {
    auto& config = common::Config::instance();
    std::string config_path = config.getConfigPath();
    
    if (!canWriteConfig(config_path)) {
        std::cerr << "\033[31mError: Permission denied\033[0m\n\n";
        std::cerr << "Resource: " << config_path << "\n";
        std::cerr << "Check file permissions: ls -l " << config_path << "\n";
        return 1;
    }
    
    if (!config.getValue(set_key_)) {
        std::cerr << "Unknown configuration key: " << set_key_ << "\n";
        return 1;
    }
    
    if (!config.setValue(set_key_, set_value_)) {
        std::cerr << "Invalid value for " << set_key_ << ": " << set_value_ << "\n";
        return 1;
    }
    
    if (config.save()) {
        std::cout << "✓ Configuration updated: " << set_key_ << " = " << set_value_ << "\n";
        return 0;
    }
    
    std::cerr << "Failed to save configuration.\n";
    return 1;
}

int ConfigCommand::executeGet() {
    auto& config = common::Config::instance();
    
    if (get_key_.empty()) {
        std::cout << "Configuration:\n";
        for (const auto& [key, value] : config.allValues()) {
            std::cout << "  " << key << " = " << value << "\n";
        }
        return 0;
    }
    
    auto value = config.getValue(get_key_);
    if (!value) {
        std::cerr << "Unknown configuration key: " << get_key_ << "\n";
        return 1;
    }
    
    std::cout << *value << "\n";
    return 0;
}

int ConfigCommand::executeShow() {
    auto& config = common::Config::instance();
    std::string config_path = config.getConfigPath();
    
    if (!std::filesystem::exists(config_path)) {
        std::cerr << "Configuration file does not exist.\n";
        std::cerr << "Expected: " << config_path << "\n";
        std::cerr << "Defaults are in effect; create it with: ps3-update config set KEY VALUE\n";
        return 1;
    }
    
    std::cout << "Configuration file: " << config_path << "\n\n";
    
    std::ifstream file(config_path);
    if (!file) {
        std::cerr << "Failed to read configuration file.\n";
        return 1;
    }
    
    std::string line;
    while (std::getline(file, line)) {
        std::cout << line << "\n";
    }
    
    return 0;
}

bool ConfigCommand::canWriteConfig(const std::string& config_path) const {
    if (std::filesystem::exists(config_path)) {
        return access(config_path.c_str(), W_OK) == 0;
    }
    
    std::filesystem::path parent = std::filesystem::path(config_path).parent_path();
    while (!parent.empty() && !std::filesystem::exists(parent)) {
        parent = parent.parent_path();
    }
    return parent.empty() || access(parent.c_str(), W_OK) == 0;
}

}}
