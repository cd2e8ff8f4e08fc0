#pragma once

#include <string>

namespace ps3_update {
namespace network {

struct Url {
    std::string scheme;
    std::string host;
    int port = 80;
    std::string path = "/";
    
    bool isHttps() const { return scheme == "https"; }
    
    // scheme://host:port, the form httplib::Client accepts.
    std::string origin() const;
};

Url parseUrl(const std::string& url);

}}
