#pragma once

#include "main_command.hpp"
#include <CLI/CLI.hpp>
#include <string>

namespace ps3_update {
namespace cli {

class ConfigCommand : public MainCommand {
public:
    ConfigCommand();
    
    void setup(CLI::App* subcommand);
    int execute();

private:
    CLI::App* set_cmd_ = nullptr;
    std::string set_key_;
    std::string set_value_;
    
    CLI::App* get_cmd_ = nullptr;
    std::string get_key_;
    
    CLI::App* show_cmd_ = nullptr;
    
    int executeSet();
    int executeGet();
    int executeShow();
    
    bool canWriteConfig(const std::string& config_path) const;
};

}}
