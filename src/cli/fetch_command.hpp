#pragma once

#include "main_command.hpp"
#include "ps3_update/common/types.hpp"
#include <CLI/CLI.hpp>
#include <string>
#include <vector>

namespace ps3_update {
namespace cli {

class FetchCommand : public MainCommand {
public:
    FetchCommand();
    
    void setup(CLI::App* subcommand);
    int execute();

private:
    std::vector<std::string> identifiers_;
    bool json_output_ = false;
    
    int executeSingle();
    int executeBatch();
    
    void printResult(const common::DiscoveryResult& result) const;
};

}}
