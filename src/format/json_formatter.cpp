#include "ps3_update/format/json_formatter.hpp"

namespace ps3_update {
namespace format {

nlohmann::json JsonFormatter::format(const common::PackageDescriptor& package) {
    nlohmann::json json;
    json["version"] = package.version;
    json["system_ver"] = package.system_ver;
    json["size_bytes"] = package.size_bytes;
    json["size_human"] = package.size_human;
    json["url"] = package.url;
    json["sha1"] = package.sha1;
    json["filename"] = package.filename;
    return json;
}

nlohmann::json JsonFormatter::format(const common::DiscoveryResult& result) {
    nlohmann::json json;
    
    nlohmann::json results = nlohmann::json::array();
    for (const auto& package : result.results) {
        results.push_back(format(package));
    }
    json["results"] = results;
    
    if (result.error) {
        json["error"] = *result.error;
    } else {
        json["error"] = nullptr;
    }
    
    json["game_title"] = result.game_title;
    json["cleaned_title_id"] = result.cleaned_title_id;
    return json;
}

nlohmann::json JsonFormatter::format(const common::ProgressSnapshot& snapshot) {
    nlohmann::json json;
    json["job_id"] = snapshot.job_id;
    json["filename"] = snapshot.filename;
    json["total"] = snapshot.total;
    json["downloaded"] = snapshot.transferred;
    json["percent"] = snapshot.percent;
    json["speed_bytes_per_sec"] = snapshot.bytes_per_second;
    json["speed_human"] = snapshot.throughput_human;
    json["done"] = snapshot.done;
    
    if (snapshot.error) {
        json["error"] = *snapshot.error;
    } else {
        json["error"] = nullptr;
    }
    
    return json;
}

nlohmann::json JsonFormatter::format(const std::vector<update::BatchDiscovery>& batch) {
    nlohmann::json json = nlohmann::json::array();
    for (const auto& entry : batch) {
        json.push_back(formatBatchEntry(entry));
    }
    return json;
}

nlohmann::json JsonFormatter::formatBatchEntry(const update::BatchDiscovery& entry) {
    nlohmann::json json;
    json["input"] = entry.identifier;
    
    if (entry.result) {
        json["result"] = format(*entry.result);
        json["error"] = nullptr;
    } else {
        json["result"] = nullptr;
        nlohmann::json error;
        if (entry.error_code) {
            error["code"] = update::UpdateErrorCodeHelper::toString(*entry.error_code);
        }
        error["message"] = entry.error_message;
        json["error"] = error;
    }
    
    return json;
}

}}
