#pragma once

#include "ps3_update/network/http_options.hpp"
#include <CLI/CLI.hpp>
#include <string>

namespace ps3_update {
namespace cli {

class MainCommand {
public:
    MainCommand();
    virtual ~MainCommand();
    
    bool wasCalled() const { return was_called_; }

protected:
    CLI::App* subcommand_ = nullptr;
    bool was_called_ = false;
    
    network::HttpOptions httpOptions() const;
    bool useColors() const;
};

}}
