#pragma once

#include "../common/types.hpp"
#include <optional>
#include <string>
#include <vector>

namespace ps3_update {
namespace update {

// Where the package list was found. Vendor documents use all three shapes.
enum class PackageLayout {
    WRAPPED_LOWER,
    WRAPPED_UPPER,
    UNWRAPPED
};

struct RawPackage {
    std::optional<std::string> url;
    std::optional<std::string> digest;
    std::optional<std::string> sha1;
    std::optional<std::string> sha1sum;
    std::optional<std::string> size;
    std::optional<std::string> version;
    std::optional<std::string> system_ver;
    std::optional<std::string> title;
};

struct ParsedMetadata {
    std::vector<RawPackage> packages;
    std::optional<PackageLayout> layout;
};

std::optional<std::string> extractRawTitle(const std::string& text);

// Throws UpdateError(XML_PARSE_ERROR) when the document is not well formed.
ParsedMetadata parseMetadataXml(const std::string& text);

common::PackageDescriptor toDescriptor(const RawPackage& raw);

double parseVersion(const std::string& version);

void sortByVersionDescending(std::vector<common::PackageDescriptor>& packages);

common::DiscoveryResult buildDiscoveryResult(const std::string& identifier, const std::string& body);

std::string to_string(PackageLayout layout);

}}
