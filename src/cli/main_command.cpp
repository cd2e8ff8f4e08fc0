#include "main_command.hpp"
#include "ps3_update/common/config.hpp"
#include <unistd.h>

namespace ps3_update {
namespace cli {

MainCommand::MainCommand() = default;
MainCommand::~MainCommand() = default;

network::HttpOptions MainCommand::httpOptions() const {
    const auto& config = common::Config::instance().global();
    
    network::HttpOptions options;
    options.timeout_seconds = config.network.timeout;
    options.verify_tls = config.network.verify_tls;
    options.user_agent = config.network.user_agent;
    return options;
}

bool MainCommand::useColors() const {
    return isatty(STDOUT_FILENO);
}

}}
