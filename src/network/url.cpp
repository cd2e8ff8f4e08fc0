#include "ps3_update/network/url.hpp"
#include <stdexcept>
#include <cctype>

namespace ps3_update {
namespace network {

std::string Url::origin() const {
    return scheme + "://" + host + ":" + std::to_string(port);
}

Url parseUrl(const std::string& url) {
    Url parsed;
    std::string rest;
    
    size_t scheme_pos = url.find("://");
    if (scheme_pos != std::string::npos) {
        parsed.scheme = url.substr(0, scheme_pos);
        rest = url.substr(scheme_pos + 3);
    } else {
        parsed.scheme = "http";
        rest = url;
    }
    
    for (auto& c : parsed.scheme) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    
    if (parsed.scheme != "http" && parsed.scheme != "https") {
        throw std::invalid_argument("Unsupported URL scheme: " + parsed.scheme);
    }
    
    size_t path_pos = rest.find_first_of("/?");
    std::string host_and_port = rest.substr(0, path_pos);
    if (path_pos != std::string::npos) {
        parsed.path = rest.substr(path_pos);
        if (parsed.path.front() == '?') {
            parsed.path = "/" + parsed.path;
        }
    }
    
    size_t port_pos = host_and_port.find(':');
    if (port_pos != std::string::npos) {
        parsed.host = host_and_port.substr(0, port_pos);
        parsed.port = std::stoi(host_and_port.substr(port_pos + 1));
    } else {
        parsed.host = host_and_port;
        parsed.port = parsed.isHttps() ? 443 : 80;
    }
    
    if (parsed.host.empty()) {
        throw std::invalid_argument("URL has no host: " + url);
    }
    
    return parsed;
}

}}
