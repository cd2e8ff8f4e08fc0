#include <catch2/catch_test_macros.hpp>
#include <locale>
#include <string>
#include <vector>

#include "ps3_update/update/metadata_parser.hpp"
#include "ps3_update/update/error_codes.hpp"

using namespace ps3_update;
using namespace ps3_update::update;

namespace {

const char* WRAPPED_LOWER_XML = R"(<?xml version="1.0" encoding="UTF-8"?>
<titlepatch titleid="BLES00779">
  <tag name="BLES00779_T5" popup="true" signoff="true">
    <package version="1.03" size="52428800" digest="aaa111" url="http://example.com/BLES00779-VER_0103.pkg" ps3_system_ver="03.4100"/>
    <package version="1.04" size="104857600" digest="bbb222" url="http://example.com/BLES00779-VER_0104.pkg" ps3_system_ver="03.5500">
      <paramsfo>
        <TITLE>Demon's Souls</TITLE>
      </paramsfo>
    </package>
  </tag>
</titlepatch>
)";

const char* WRAPPED_UPPER_XML = R"(<TITLEPATCH>
  <TAG>
    <PACKAGE version="2.00" size="1024" sha1="ccc333" url="http://example.com/b/UP.pkg"/>
  </TAG>
</TITLEPATCH>
)";

const char* UNWRAPPED_XML = R"(<titlepatch>
  <package version="1.10" size="2048" sha1sum="ddd444" url="http://example.com/c/flat.pkg"/>
</titlepatch>
)";

}

TEST_CASE("Metadata layouts", "[metadata]") {
    SECTION("Lowercase tag wrapper") {
        auto parsed = parseMetadataXml(WRAPPED_LOWER_XML);
        REQUIRE(parsed.layout == PackageLayout::WRAPPED_LOWER);
        REQUIRE(parsed.packages.size() == 2);
    }
    
    SECTION("Uppercase TAG wrapper with PACKAGE elements") {
        auto parsed = parseMetadataXml(WRAPPED_UPPER_XML);
        REQUIRE(parsed.layout == PackageLayout::WRAPPED_UPPER);
        REQUIRE(parsed.packages.size() == 1);
        REQUIRE(parsed.packages[0].version == std::optional<std::string>("2.00"));
    }
    
    SECTION("Packages directly under the root") {
        auto parsed = parseMetadataXml(UNWRAPPED_XML);
        REQUIRE(parsed.layout == PackageLayout::UNWRAPPED);
        REQUIRE(parsed.packages.size() == 1);
    }
    
    SECTION("No packages at all") {
        auto parsed = parseMetadataXml("<titlepatch><tag/></titlepatch>");
        REQUIRE(parsed.packages.empty());
        REQUIRE_FALSE(parsed.layout.has_value());
    }
    
    SECTION("Malformed document") {
        try {
            parseMetadataXml("<titlepatch><tag>");
            FAIL("expected XML_PARSE_ERROR");
        } catch (const UpdateError& e) {
            REQUIRE(e.code() == UpdateErrorCode::XML_PARSE_ERROR);
        }
    }
}

TEST_CASE("Package descriptor conversion", "[metadata]") {
    SECTION("Hash fallback order is digest, sha1, sha1sum") {
        RawPackage raw;
        raw.sha1 = "second";
        raw.sha1sum = "third";
        REQUIRE(toDescriptor(raw).sha1 == "second");
        
        raw.digest = " first ";
        REQUIRE(toDescriptor(raw).sha1 == "first");
        
        RawPackage only_sum;
        only_sum.sha1sum = "third";
        REQUIRE(toDescriptor(only_sum).sha1 == "third");
        
        REQUIRE(toDescriptor(RawPackage{}).sha1.empty());
    }
    
    SECTION("Missing attributes get defaults") {
        auto descriptor = toDescriptor(RawPackage{});
        REQUIRE(descriptor.version == "Unknown");
        REQUIRE(descriptor.system_ver.empty());
        REQUIRE(descriptor.size_bytes == 0);
        REQUIRE(descriptor.size_human == "Unknown");
        REQUIRE(descriptor.url.empty());
        REQUIRE(descriptor.filename == "update.pkg");
    }
    
    SECTION("Unparseable size is zero") {
        RawPackage raw;
        raw.size = "12MB";
        REQUIRE(toDescriptor(raw).size_bytes == 0);
        
        raw.size = "-5";
        REQUIRE(toDescriptor(raw).size_bytes == 0);
    }
    
    SECTION("URL is trimmed and its last segment is the filename") {
        RawPackage raw;
        raw.url = "  http://example.com/x/UP0001.pkg \n";
        raw.size = "104857600";
        auto descriptor = toDescriptor(raw);
        REQUIRE(descriptor.url == "http://example.com/x/UP0001.pkg");
        REQUIRE(descriptor.filename == "UP0001.pkg");
        REQUIRE(descriptor.size_human == "100.00 MB");
    }
}

TEST_CASE("Version ordering", "[metadata][sort]") {
    SECTION("Version parsing") {
        REQUIRE(parseVersion("1.04") == 1.04);
        REQUIRE(parseVersion("01.10") == 1.10);
        REQUIRE(parseVersion("Unknown") == 0.0);
        REQUIRE(parseVersion("1.0.2") == 0.0);
        REQUIRE(parseVersion("") == 0.0);
        REQUIRE(parseVersion("inf") == 0.0);
        REQUIRE(parseVersion("1.04 ") == 0.0);
    }
    
    SECTION("Hexadecimal is not a version") {
        REQUIRE(parseVersion("0x10") == 0.0);
        REQUIRE(parseVersion("0X1.8p1") == 0.0);
    }
    
    SECTION("Independent of the global locale") {
        struct CommaDecimal : std::numpunct<char> {
            char do_decimal_point() const override { return ','; }
        };
        
        std::locale previous = std::locale::global(std::locale(std::locale::classic(), new CommaDecimal));
        double parsed = parseVersion("1.04");
        double comma = parseVersion("1,04");
        std::locale::global(previous);
        
        REQUIRE(parsed == 1.04);
        REQUIRE(comma == 0.0);
    }
    
    SECTION("Descending and stable for equal keys") {
        std::vector<common::PackageDescriptor> packages(5);
        packages[0].version = "1.01";
        packages[1].version = "garbage";
        packages[1].url = "first-unparseable";
        packages[2].version = "1.10";
        packages[3].version = "";
        packages[3].url = "second-unparseable";
        packages[4].version = "1.02";
        
        sortByVersionDescending(packages);
        
        REQUIRE(packages[0].version == "1.10");
        REQUIRE(packages[1].version == "1.02");
        REQUIRE(packages[2].version == "1.01");
        REQUIRE(packages[3].url == "first-unparseable");
        REQUIRE(packages[4].url == "second-unparseable");
    }
}

TEST_CASE("Raw title extraction", "[metadata][title]") {
    REQUIRE(extractRawTitle("<x><TITLE>  Game  </TITLE></x>") == std::optional<std::string>("Game"));
    REQUIRE_FALSE(extractRawTitle("<x><TITLE>   </TITLE></x>").has_value());
    REQUIRE_FALSE(extractRawTitle("<x><TITLE>open").has_value());
    REQUIRE_FALSE(extractRawTitle("<x/>").has_value());
}

TEST_CASE("Discovery result assembly", "[metadata]") {
    SECTION("Sorted results and embedded title") {
        auto result = buildDiscoveryResult("BLES00779", WRAPPED_LOWER_XML);
        REQUIRE(result.cleaned_title_id == "BLES00779");
        REQUIRE_FALSE(result.error.has_value());
        REQUIRE(result.results.size() == 2);
        REQUIRE(result.results[0].version == "1.04");
        REQUIRE(result.results[0].sha1 == "bbb222");
        REQUIRE(result.results[0].system_ver == "03.5500");
        REQUIRE(result.results[1].version == "1.03");
        REQUIRE(result.game_title == "Demon's Souls");
    }
    
    SECTION("Title falls back to unknown") {
        auto result = buildDiscoveryResult("NPUA80662", UNWRAPPED_XML);
        REQUIRE(result.game_title == "Unknown Title");
    }
    
    SECTION("Raw title is used when packages carry none") {
        auto result = buildDiscoveryResult("NPUA80662",
            "<titlepatch><package version=\"1.00\" url=\"http://e/x.pkg\"/><TITLE>Raw Name</TITLE></titlepatch>");
        REQUIRE(result.game_title == "Raw Name");
    }
    
    SECTION("Empty package list is a success with an error message") {
        auto result = buildDiscoveryResult("BLUS30001", "<titlepatch><TITLE>Lonely</TITLE></titlepatch>");
        REQUIRE(result.results.empty());
        REQUIRE(result.error == std::optional<std::string>("No <package> entries found in XML for BLUS30001"));
        REQUIRE(result.game_title == "Lonely");
    }
}
