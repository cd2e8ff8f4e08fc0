#pragma once

#include "../common/types.hpp"
#include "../update/fetcher.hpp"
#include <nlohmann/json.hpp>
#include <vector>

namespace ps3_update {
namespace format {

class JsonFormatter {
public:
    static nlohmann::json format(const common::PackageDescriptor& package);
    static nlohmann::json format(const common::DiscoveryResult& result);
    static nlohmann::json format(const common::ProgressSnapshot& snapshot);
    static nlohmann::json format(const std::vector<update::BatchDiscovery>& batch);

private:
    static nlohmann::json formatBatchEntry(const update::BatchDiscovery& entry);
};

}}
