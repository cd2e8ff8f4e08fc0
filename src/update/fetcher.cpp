#include "ps3_update/update/fetcher.hpp"
#include "ps3_update/update/metadata_parser.hpp"
#include "ps3_update/common/format.hpp"
#include "ps3_update/common/logger.hpp"
#include "../network/http_session.hpp"
#include <tbb/parallel_for.h>
#include <algorithm>
#include <chrono>

namespace ps3_update {
namespace update {

namespace {

network::Url parseBaseUrl(const std::string& url) {
    try {
        return network::parseUrl(url);
    } catch (const std::exception& e) {
        throw UpdateError(UpdateErrorCode::NETWORK_ERROR, e.what(),
                          common::ErrorContext{"fetcher"}.with("url", url));
    }
}

}

MetadataFetcher::MetadataFetcher(std::string base_url, network::HttpOptions options)
    : base_url_(std::move(base_url)), options_(std::move(options)) {
    while (!base_url_.empty() && base_url_.back() == '/') {
        base_url_.pop_back();
    }
}

std::string MetadataFetcher::buildMetadataPath(const std::string& normalized_id) const {
    auto base = parseBaseUrl(base_url_);
    std::string prefix = base.path == "/" ? "" : base.path;
    return prefix + constants::network::METADATA_PATH_PREFIX + normalized_id + "/" +
           normalized_id + constants::network::METADATA_PATH_SUFFIX;
}

std::string MetadataFetcher::buildMetadataUrl(const std::string& normalized_id) const {
    return parseBaseUrl(base_url_).origin() + buildMetadataPath(normalized_id);
}

common::DiscoveryResult MetadataFetcher::discover(const std::string& identifier) const {
    std::string cleaned = common::normalizeIdentifier(identifier);

    if (cleaned.empty()) {
        throw UpdateError(UpdateErrorCode::INVALID_IDENTIFIER, "Empty or invalid Title ID",
                          common::ErrorContext{"fetcher"}.with("input", identifier));
    }

    auto base = parseBaseUrl(base_url_);
    std::string path = buildMetadataPath(cleaned);

    common::Logger::instance().info("[Fetcher] Request | id={} | host={} | path={}", cleaned, base.host, path);

    auto start_time = std::chrono::steady_clock::now();
    auto client = network::makeClient(base, options_);
    auto response = client->Get(path);

    if (!response) {
        std::string reason = httplib::to_string(response.error());
        auto context = common::ErrorContext{"fetcher"}.with("id", cleaned).with("host", base.host);
        common::Logger::instance().error("[Fetcher] Network error | error={} | {}",
                                         reason, common::formatContext(context));
        throw UpdateError(UpdateErrorCode::NETWORK_ERROR, reason, context);
    }

    if (!network::isSuccessStatus(response->status)) {
        auto context = common::ErrorContext{"fetcher"}.with("id", cleaned).with("status", std::to_string(response->status));
        common::Logger::instance().info("[Fetcher] No updates | {}", common::formatContext(context));
        throw UpdateError(UpdateErrorCode::NO_UPDATES_FOUND, cleaned, context);
    }

    common::DiscoveryResult result;
    try {
        result = buildDiscoveryResult(cleaned, response->body);
    } catch (const UpdateError& e) {
        common::Logger::instance().error("[Fetcher] Parse failed | id={} | error={} | {}",
                                         cleaned, e.what(), common::formatContext(e.context()));
        throw;
    }

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start_time);
    common::Logger::instance().info("[Fetcher] Complete | id={} | packages={} | title={} | duration_ms={}",
                                    cleaned, result.results.size(), result.game_title, elapsed.count());

    return result;
}

std::vector<BatchDiscovery> MetadataFetcher::discoverMany(const std::vector<std::string>& identifiers) const {
    std::vector<BatchDiscovery> entries(identifiers.size());

    tbb::parallel_for(size_t(0), identifiers.size(), [&](size_t i) {
        auto& entry = entries[i];
        entry.identifier = identifiers[i];

        try {
            entry.result = discover(identifiers[i]);
        } catch (const UpdateError& e) {
            entry.error_code = e.code();
            entry.error_message = e.what();
            common::Logger::instance().debug("[Fetcher] Batch entry failed | input={} | code={} | {}",
                                             identifiers[i], UpdateErrorCodeHelper::toString(e.code()),
                                             common::formatContext(e.context()));
        } catch (const std::exception& e) {
            entry.error_code = UpdateErrorCode::NETWORK_ERROR;
            entry.error_message = e.what();
        }
    });

    size_t succeeded = std::count_if(entries.begin(), entries.end(),
                                     [](const BatchDiscovery& e) { return e.success(); });
    common::Logger::instance().info("[Fetcher] Batch complete | success={} | total={}",
                                    succeeded, entries.size());

    return entries;
}

bool MetadataFetcher::checkServerStatus() const {
    try {
        auto base = parseBaseUrl(base_url_);
        auto client = network::makeClient(base, options_);
        auto response = client->Head(base.path);

        if (!response) {
            common::Logger::instance().warn("[Fetcher] Server unreachable | host={} | error={}",
                                            base.host, httplib::to_string(response.error()));
            return false;
        }

        common::Logger::instance().debug("[Fetcher] Server reachable | host={} | status={}",
                                         base.host, response->status);
        return true;
    } catch (const UpdateError& e) {
        common::Logger::instance().warn("[Fetcher] Status check failed | error={} | {}",
                                        e.what(), common::formatContext(e.context()));
        return false;
    }
}

}}
