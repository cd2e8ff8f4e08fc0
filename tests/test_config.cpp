#include <catch2/catch_test_macros.hpp>
#include <fstream>

#include "ps3_update/common/config.hpp"
#include "support/stub_server.hpp"

using namespace ps3_update;
using namespace ps3_update::common;

TEST_CASE("Configuration loading", "[config]") {
    testing::TempDir dir;
    auto path = (dir.path() / "ps3-update.conf").string();
    auto& config = Config::instance();
    
    SECTION("Missing file keeps defaults") {
        REQUIRE(config.load(path));
        REQUIRE(config.global().network.metadata_url == "https://a0.ww.np.dl.playstation.net");
        REQUIRE(config.global().network.timeout == 60);
        REQUIRE_FALSE(config.global().network.verify_tls);
        REQUIRE(config.global().download.multipart);
        REQUIRE(config.global().download.parts == 4);
        REQUIRE(config.global().download.buffer_kb == 256);
        REQUIRE(config.getConfigPath() == path);
    }
    
    SECTION("File values override defaults") {
        {
            std::ofstream file(path);
            file << "[global]\n"
                 << "log_level = \"DEBUG\"\n"
                 << "[network]\n"
                 << "metadata_url = \"http://127.0.0.1:9000\"\n"
                 << "timeout = 5\n"
                 << "[download]\n"
                 << "multipart = false\n"
                 << "parts = 8\n"
                 << "[logging]\n"
                 << "format = \"json\"\n";
        }
        
        REQUIRE(config.load(path));
        REQUIRE(config.global().log_level == LogLevel::DEBUG);
        REQUIRE(config.global().network.metadata_url == "http://127.0.0.1:9000");
        REQUIRE(config.global().network.timeout == 5);
        REQUIRE_FALSE(config.global().download.multipart);
        REQUIRE(config.global().download.parts == 8);
        REQUIRE(config.global().logging.format == LogFormat::JSON);
    }
    
    SECTION("Set, save and reload") {
        REQUIRE(config.load(path));
        REQUIRE(config.setValue("download.parts", "6"));
        REQUIRE(config.setValue("network.verify_tls", "true"));
        REQUIRE(config.save());
        
        REQUIRE(config.load(path));
        REQUIRE(config.getValue("download.parts") == std::optional<std::string>("6"));
        REQUIRE(config.getValue("network.verify_tls") == std::optional<std::string>("true"));
    }
    
    SECTION("Rejects unknown keys and bad values") {
        REQUIRE(config.load(path));
        REQUIRE_FALSE(config.setValue("no.such.key", "1"));
        REQUIRE_FALSE(config.setValue("log_level", "LOUD"));
        REQUIRE_FALSE(config.setValue("download.parts", "many"));
        REQUIRE_FALSE(config.getValue("no.such.key").has_value());
    }
    
    SECTION("All values lists every key") {
        REQUIRE(config.load(path));
        auto values = config.allValues();
        REQUIRE(values.count("network.metadata_url") == 1);
        REQUIRE(values.count("download.buffer_kb") == 1);
        REQUIRE(values.count("logging.format") == 1);
    }
    
    config.load(path);
}

TEST_CASE("Log level names", "[config]") {
    REQUIRE(to_string(LogLevel::WARN) == "WARN");
    REQUIRE(parseLogLevel("ERROR") == std::optional<LogLevel>(LogLevel::ERROR));
    REQUIRE_FALSE(parseLogLevel("verbose").has_value());
}
