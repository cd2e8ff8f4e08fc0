#pragma once

#include "ps3_update/network/http_options.hpp"
#include "ps3_update/network/url.hpp"
#define CPPHTTPLIB_OPENSSL_SUPPORT
#include <httplib.h>
#include <memory>
#include <string>

namespace ps3_update {
namespace network {

// Vendor certificates are unreliable, so verification follows HttpOptions::verify_tls (off by default).
inline std::unique_ptr<httplib::Client> makeClient(const Url& url, const HttpOptions& options) {
    auto client = std::make_unique<httplib::Client>(url.origin());
    client->set_connection_timeout(options.timeout_seconds, 0);
    client->set_read_timeout(options.timeout_seconds, 0);
    client->set_write_timeout(options.timeout_seconds, 0);
    client->set_follow_location(true);
    client->enable_server_certificate_verification(options.verify_tls);
    client->set_default_headers({{"User-Agent", options.user_agent}});
    return client;
}

inline bool isSuccessStatus(int status) {
    return status >= 200 && status < 300;
}

inline uint64_t parseContentLength(const httplib::Response& response) {
    if (!response.has_header("Content-Length")) {
        return 0;
    }
    try {
        return std::stoull(response.get_header_value("Content-Length"));
    } catch (const std::exception&) {
        return 0;
    }
}

}}
