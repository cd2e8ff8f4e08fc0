#pragma once

#include "main_command.hpp"
#include <CLI/CLI.hpp>

namespace ps3_update {
namespace cli {

class StatusCommand : public MainCommand {
public:
    StatusCommand();
    
    void setup(CLI::App* subcommand);
    int execute();
};

}}
