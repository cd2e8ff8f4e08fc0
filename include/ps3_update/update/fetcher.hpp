#pragma once

#include "../common/types.hpp"
#include "../common/constants.hpp"
#include "../network/http_options.hpp"
#include "error_codes.hpp"
#include <optional>
#include <string>
#include <vector>

namespace ps3_update {
namespace update {

struct BatchDiscovery {
    std::string identifier;
    std::optional<common::DiscoveryResult> result;
    std::optional<UpdateErrorCode> error_code;
    std::string error_message;
    
    bool success() const { return result.has_value(); }
};

class MetadataFetcher {
public:
    explicit MetadataFetcher(std::string base_url = constants::network::DEFAULT_METADATA_URL,
                             network::HttpOptions options = {});
    
    // Throws UpdateError: INVALID_IDENTIFIER, NO_UPDATES_FOUND, NETWORK_ERROR, XML_PARSE_ERROR.
    common::DiscoveryResult discover(const std::string& identifier) const;
    
    // Results are in input order; failures are reported per entry.
    std::vector<BatchDiscovery> discoverMany(const std::vector<std::string>& identifiers) const;
    
    bool checkServerStatus() const;
    
    std::string buildMetadataPath(const std::string& normalized_id) const;
    std::string buildMetadataUrl(const std::string& normalized_id) const;
    
    const std::string& baseUrl() const { return base_url_; }

private:
    std::string base_url_;
    network::HttpOptions options_;
};

}}
