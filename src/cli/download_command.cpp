#include "download_command.hpp"
#include "ps3_update/common/config.hpp"
#include "ps3_update/common/constants.hpp"
#include "ps3_update/common/format.hpp"
#include "ps3_update/common/logger.hpp"
#include "ps3_update/common/progress_bar.hpp"
#include "ps3_update/download/job_registry.hpp"
#include "ps3_update/download/transfer_engine.hpp"
#include "ps3_update/format/json_formatter.hpp"
#include "ps3_update/update/fetcher.hpp"
#include <algorithm>
#include <csignal>
#include <iostream>

namespace ps3_update {
namespace cli {

namespace {

volatile std::sig_atomic_t g_interrupted = 0;

void handleInterrupt(int) {
    g_interrupted = 1;
}

}

DownloadCommand::DownloadCommand() = default;

void DownloadCommand::setup(CLI::App* subcommand) {
    subcommand_ = subcommand;
    
    subcommand->add_option("target", target_, "Title ID or package URL")->required();
    subcommand->add_option("--version", version_, "Package version (default: latest)");
    subcommand->add_option("-o,--output", output_, "Destination file path");
    subcommand->add_option("-p,--parts", parts_, "Number of parallel range requests")
              ->check(CLI::Range(size_t(1), constants::transfer::MAX_PARTS));
    subcommand->add_flag("--direct", direct_, "Use a single streaming request");
    subcommand->add_flag("--json", json_output_, "Print the final progress as JSON");
    
    subcommand->callback([this]() { was_called_ = true; });
}

int DownloadCommand::execute() {
    try {
        auto target = resolve();
        if (!target) {
            return 1;
        }
        return runTransfer(*target);
        
    } catch (const update::UpdateError& e) {
        common::Logger::instance().error("[Download] Failed | code={} | {}",
                                         update::UpdateErrorCodeHelper::toString(e.code()),
                                         common::formatContext(e.context()));
        std::cerr << "Error: " << e.what() << std::endl;
        return e.code() == update::UpdateErrorCode::NO_UPDATES_FOUND ? 2 : 1;
    }
}

bool DownloadCommand::isUrl(const std::string& value) {
    return value.rfind("http://", 0) == 0 || value.rfind("https://", 0) == 0;
}

std::optional<DownloadCommand::ResolvedTarget> DownloadCommand::resolve() {
    const auto& config = common::Config::instance().global();
    std::filesystem::path download_dir = config.download.download_dir;
    
    ResolvedTarget target;
    
    if (isUrl(target_)) {
        target.url = target_;
        target.label = common::filenameFromUrl(target_);
        target.destination = output_.empty()
            ? download_dir / constants::metadata::DEFAULT_FOLDER / target.label
            : std::filesystem::path(output_);
        return target;
    }
    
    update::MetadataFetcher fetcher(config.network.metadata_url, httpOptions());
    auto result = fetcher.discover(target_);
    
    if (result.results.empty()) {
        std::cerr << "Error: " << result.error.value_or("No packages available") << std::endl;
        return std::nullopt;
    }
    
    const common::PackageDescriptor* selected = &result.results.front();
    if (!version_.empty()) {
        auto it = std::find_if(result.results.begin(), result.results.end(),
                               [this](const common::PackageDescriptor& p) { return p.version == version_; });
        if (it == result.results.end()) {
            std::cerr << "Error: Version " << version_ << " not available for "
                      << result.cleaned_title_id << "\n";
            std::cerr << "Available:";
            for (const auto& package : result.results) {
                std::cerr << " " << package.version;
            }
            std::cerr << std::endl;
            return std::nullopt;
        }
        selected = &*it;
    }
    
    if (selected->url.empty()) {
        std::cerr << "Error: Package " << selected->version << " has no download URL" << std::endl;
        return std::nullopt;
    }
    
    target.url = selected->url;
    target.label = result.game_title + " v" + selected->version;
    target.destination = output_.empty()
        ? download_dir / common::packageFolderName(result.game_title, result.cleaned_title_id) / selected->filename
        : std::filesystem::path(output_);
    
    common::Logger::instance().info("[Download] Resolved | id={} | version={} | url={}",
                                    result.cleaned_title_id, selected->version, selected->url);
    return target;
}

common::TransferMode DownloadCommand::transferMode() const {
    const auto& config = common::Config::instance().global();
    
    if (direct_ || (!config.download.multipart && parts_ == 0)) {
        return common::TransferMode::direct();
    }
    
    size_t parts = parts_ > 0 ? parts_ : config.download.parts;
    return common::TransferMode::multiPart(std::min(parts, constants::transfer::MAX_PARTS));
}

int DownloadCommand::runTransfer(const ResolvedTarget& target) {
    const auto& config = common::Config::instance().global();
    
    download::JobRegistry registry;
    download::TransferOptions options;
    options.http = httpOptions();
    options.buffer_kb = config.download.buffer_kb;
    download::TransferEngine engine(registry, options);
    
    auto handle = engine.start(target.url, target.destination, transferMode());
    
    if (!json_output_) {
        std::cout << "Downloading to " << target.destination.string() << "\n";
    }
    
    g_interrupted = 0;
    auto previous_handler = std::signal(SIGINT, handleInterrupt);
    
    common::ProgressBarRenderer bar(target.label, useColors());
    auto poll = std::chrono::milliseconds(constants::transfer::POLL_INTERVAL_MS);
    
    while (!engine.waitFor(handle.job_id, poll)) {
        if (g_interrupted) {
            break;
        }
        if (!json_output_) {
            bar.update(registry.snapshot(handle.job_id));
            bar.render(std::cout);
        }
    }
    
    std::signal(SIGINT, previous_handler);
    
    if (g_interrupted) {
        engine.cancel(handle.job_id);
        bar.clear(std::cout);
        
        std::error_code ec;
        std::filesystem::remove(target.destination, ec);
        
        std::cerr << "Interrupted: " << update::UpdateErrorCodeHelper::getMessage(
            update::UpdateErrorCode::TRANSFER_CANCELLED) << std::endl;
        return 130;
    }
    
    auto snapshot = registry.snapshot(handle.job_id);
    registry.remove(handle.job_id);
    
    bar.complete();
    bar.render(std::cout);
    
    if (json_output_) {
        std::cout << format::JsonFormatter::format(snapshot).dump(2) << std::endl;
    }
    
    if (snapshot.error) {
        if (!json_output_) {
            std::cerr << "Error: " << *snapshot.error << std::endl;
        }
        return 1;
    }
    
    if (!json_output_) {
        std::cout << "Saved " << common::formatSize(snapshot.transferred) << " to "
                  << target.destination.string() << "\n";
    }
    return 0;
}

}}
