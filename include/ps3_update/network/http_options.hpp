#pragma once

#include "../common/constants.hpp"
#include <string>

namespace ps3_update {
namespace network {

struct HttpOptions {
    int timeout_seconds = constants::network::DEFAULT_TIMEOUT_SECONDS;
    bool verify_tls = constants::network::DEFAULT_VERIFY_TLS;
    std::string user_agent = constants::network::USER_AGENT;
};

}}
