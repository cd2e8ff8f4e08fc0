#include "fetch_command.hpp"
#include "ps3_update/common/config.hpp"
#include "ps3_update/common/logger.hpp"
#include "ps3_update/format/json_formatter.hpp"
#include "ps3_update/update/fetcher.hpp"
#include <iostream>

namespace ps3_update {
namespace cli {

FetchCommand::FetchCommand() = default;

void FetchCommand::setup(CLI::App* subcommand) {
    subcommand_ = subcommand;
    
    subcommand->add_option("ids", identifiers_, "Title IDs (e.g. BLES00779)")->required();
    subcommand->add_flag("--json", json_output_, "Print results as JSON");
    
    subcommand->callback([this]() { was_called_ = true; });
}

int FetchCommand::execute() {
    if (identifiers_.size() == 1) {
        return executeSingle();
    }
    return executeBatch();
}

int FetchCommand::executeSingle() {
    update::MetadataFetcher fetcher(common::Config::instance().global().network.metadata_url, httpOptions());
    
    try {
        auto result = fetcher.discover(identifiers_.front());
        
        if (json_output_) {
            std::cout << format::JsonFormatter::format(result).dump(2) << std::endl;
        } else {
            printResult(result);
        }
        
        return result.results.empty() ? 1 : 0;
        
    } catch (const update::UpdateError& e) {
        common::Logger::instance().debug("[Fetch] Failed | code={} | {}",
                                         update::UpdateErrorCodeHelper::toString(e.code()),
                                         common::formatContext(e.context()));
        if (e.code() == update::UpdateErrorCode::NO_UPDATES_FOUND) {
            std::cout << e.what() << "\n";
            return 2;
        }
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}

int FetchCommand::executeBatch() {
    update::MetadataFetcher fetcher(common::Config::instance().global().network.metadata_url, httpOptions());
    auto entries = fetcher.discoverMany(identifiers_);
    
    if (json_output_) {
        std::cout << format::JsonFormatter::format(entries).dump(2) << std::endl;
    } else {
        for (const auto& entry : entries) {
            if (entry.result) {
                printResult(*entry.result);
            } else {
                std::cout << entry.identifier << ": " << entry.error_message << "\n";
            }
            std::cout << "\n";
        }
    }
    
    for (const auto& entry : entries) {
        if (!entry.success()) {
            return 1;
        }
    }
    return 0;
}

void FetchCommand::printResult(const common::DiscoveryResult& result) const {
    bool colors = useColors();
    
    if (colors) std::cout << "\033[1m";
    std::cout << result.game_title << " (" << result.cleaned_title_id << ")";
    if (colors) std::cout << "\033[0m";
    std::cout << "\n";
    
    if (result.error) {
        std::cout << "  " << *result.error << "\n";
        return;
    }
    
    for (const auto& package : result.results) {
        std::cout << "  v" << package.version;
        if (!package.system_ver.empty()) {
            std::cout << "  (firmware " << package.system_ver << ")";
        }
        std::cout << "  " << package.size_human << "\n";
        std::cout << "    File: " << package.filename << "\n";
        if (!package.sha1.empty()) {
            std::cout << "    SHA1: " << package.sha1 << "\n";
        }
        std::cout << "    URL:  " << package.url << "\n";
    }
}

}}
