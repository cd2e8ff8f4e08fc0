#include "ps3_update/update/metadata_parser.hpp"
#include "ps3_update/update/error_codes.hpp"
#include "ps3_update/common/constants.hpp"
#include "ps3_update/common/format.hpp"
#include "ps3_update/common/logger.hpp"
#include <libxml/parser.h>
#include <libxml/tree.h>
#include <algorithm>
#include <array>
#include <cctype>
#include <cmath>
#include <cstring>
#include <locale>
#include <memory>
#include <mutex>
#include <sstream>

namespace ps3_update {
namespace update {

namespace {

struct LayoutStrategy {
    PackageLayout layout;
    const char* wrapper;
};

constexpr std::array<LayoutStrategy, 3> LAYOUT_STRATEGIES = {{
    {PackageLayout::WRAPPED_LOWER, "tag"},
    {PackageLayout::WRAPPED_UPPER, "TAG"},
    {PackageLayout::UNWRAPPED, nullptr}
}};

constexpr const char* TITLE_OPEN = "<TITLE>";
constexpr const char* TITLE_CLOSE = "</TITLE>";

using XmlDocPtr = std::unique_ptr<xmlDoc, decltype(&xmlFreeDoc)>;

void ensureParserInitialized() {
    static std::once_flag once;
    std::call_once(once, []() { xmlInitParser(); });
}

bool hasName(const xmlNode* node, const char* name) {
    return node->type == XML_ELEMENT_NODE &&
           std::strcmp(reinterpret_cast<const char*>(node->name), name) == 0;
}

bool isPackageElement(const xmlNode* node) {
    return hasName(node, "package") || hasName(node, "PACKAGE");
}

std::optional<std::string> attribute(xmlNode* node, const char* name) {
    xmlChar* value = xmlGetProp(node, reinterpret_cast<const xmlChar*>(name));
    if (!value) {
        return std::nullopt;
    }
    std::string result(reinterpret_cast<const char*>(value));
    xmlFree(value);
    return result;
}

std::string textContent(xmlNode* node) {
    xmlChar* content = xmlNodeGetContent(node);
    if (!content) {
        return "";
    }
    std::string result(reinterpret_cast<const char*>(content));
    xmlFree(content);
    return result;
}

xmlNode* firstChild(xmlNode* parent, const char* lower, const char* upper) {
    for (xmlNode* child = parent->children; child; child = child->next) {
        if (hasName(child, lower) || hasName(child, upper)) {
            return child;
        }
    }
    return nullptr;
}

std::optional<std::string> packageTitle(xmlNode* package) {
    xmlNode* paramsfo = firstChild(package, "paramsfo", "PARAMSFO");
    if (!paramsfo) {
        return std::nullopt;
    }
    xmlNode* title = firstChild(paramsfo, "title", "TITLE");
    if (!title) {
        return std::nullopt;
    }
    return textContent(title);
}

RawPackage readPackage(xmlNode* node) {
    RawPackage raw;
    raw.url = attribute(node, "url");
    raw.digest = attribute(node, "digest");
    raw.sha1 = attribute(node, "sha1");
    raw.sha1sum = attribute(node, "sha1sum");
    raw.size = attribute(node, "size");
    raw.version = attribute(node, "version");
    raw.system_ver = attribute(node, "ps3_system_ver");
    raw.title = packageTitle(node);
    return raw;
}

void collectPackages(xmlNode* parent, std::vector<RawPackage>& out) {
    for (xmlNode* child = parent->children; child; child = child->next) {
        if (isPackageElement(child)) {
            out.push_back(readPackage(child));
        }
    }
}

std::vector<RawPackage> applyStrategy(xmlNode* root, const LayoutStrategy& strategy) {
    std::vector<RawPackage> packages;

    if (!strategy.wrapper) {
        collectPackages(root, packages);
        return packages;
    }

    for (xmlNode* child = root->children; child; child = child->next) {
        if (hasName(child, strategy.wrapper)) {
            collectPackages(child, packages);
        }
    }
    return packages;
}

std::optional<uint64_t> parseSize(const std::string& text) {
    if (text.empty() ||
        !std::all_of(text.begin(), text.end(), [](char c) { return std::isdigit(static_cast<unsigned char>(c)); })) {
        return std::nullopt;
    }
    try {
        return std::stoull(text);
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

}

std::string to_string(PackageLayout layout) {
    switch (layout) {
        case PackageLayout::WRAPPED_LOWER: return "tag/package";
        case PackageLayout::WRAPPED_UPPER: return "TAG/package";
        case PackageLayout::UNWRAPPED: return "package";
    }
    return "unknown";
}

std::optional<std::string> extractRawTitle(const std::string& text) {
    size_t start = text.find(TITLE_OPEN);
    if (start == std::string::npos) {
        return std::nullopt;
    }
    start += std::strlen(TITLE_OPEN);

    size_t end = text.find(TITLE_CLOSE, start);
    if (end == std::string::npos) {
        return std::nullopt;
    }

    std::string title = common::trim(text.substr(start, end - start));
    if (title.empty()) {
        return std::nullopt;
    }
    return title;
}

ParsedMetadata parseMetadataXml(const std::string& text) {
    ensureParserInitialized();

    XmlDocPtr doc(xmlReadMemory(text.data(), static_cast<int>(text.size()), "metadata.xml", nullptr,
                                XML_PARSE_NONET | XML_PARSE_NOERROR | XML_PARSE_NOWARNING),
                  &xmlFreeDoc);

    if (!doc) {
        std::string reason = "malformed document";
        const xmlError* error = xmlGetLastError();
        if (error && error->message) {
            reason = common::trim(error->message);
        }
        throw UpdateError(UpdateErrorCode::XML_PARSE_ERROR, reason,
                          common::ErrorContext{"metadata"}.with("bytes", std::to_string(text.size())));
    }

    xmlNode* root = xmlDocGetRootElement(doc.get());
    if (!root) {
        throw UpdateError(UpdateErrorCode::XML_PARSE_ERROR, "document has no root element");
    }

    ParsedMetadata parsed;
    for (const auto& strategy : LAYOUT_STRATEGIES) {
        auto packages = applyStrategy(root, strategy);
        if (!packages.empty()) {
            parsed.packages = std::move(packages);
            parsed.layout = strategy.layout;
            break;
        }
    }

    return parsed;
}

common::PackageDescriptor toDescriptor(const RawPackage& raw) {
    common::PackageDescriptor descriptor;

    descriptor.url = common::trim(raw.url.value_or(""));

    if (raw.digest) {
        descriptor.sha1 = common::trim(*raw.digest);
    } else if (raw.sha1) {
        descriptor.sha1 = common::trim(*raw.sha1);
    } else if (raw.sha1sum) {
        descriptor.sha1 = common::trim(*raw.sha1sum);
    }

    descriptor.version = raw.version.value_or(constants::metadata::UNKNOWN_VERSION);
    descriptor.system_ver = raw.system_ver.value_or("");
    descriptor.size_bytes = raw.size ? parseSize(*raw.size).value_or(0) : 0;
    descriptor.size_human = common::formatSize(descriptor.size_bytes);
    descriptor.filename = common::filenameFromUrl(descriptor.url);

    return descriptor;
}

// Plain decimal only, read in the classic locale; hex and non-finite
// values sort as 0.0.
double parseVersion(const std::string& version) {
    if (version.empty() || std::isspace(static_cast<unsigned char>(version.front()))) {
        return 0.0;
    }
    if (version.find_first_of("xX") != std::string::npos) {
        return 0.0;
    }

    std::istringstream stream(version);
    stream.imbue(std::locale::classic());

    double value = 0.0;
    stream >> value;
    if (stream.fail() || stream.peek() != std::char_traits<char>::eof() || !std::isfinite(value)) {
        return 0.0;
    }
    return value;
}

void sortByVersionDescending(std::vector<common::PackageDescriptor>& packages) {
    std::stable_sort(packages.begin(), packages.end(),
        [](const common::PackageDescriptor& a, const common::PackageDescriptor& b) {
            return parseVersion(a.version) > parseVersion(b.version);
        });
}

common::DiscoveryResult buildDiscoveryResult(const std::string& identifier, const std::string& body) {
    common::DiscoveryResult result;
    result.cleaned_title_id = identifier;

    auto raw_title = extractRawTitle(body);
    auto parsed = parseMetadataXml(body);

    result.game_title = raw_title.value_or(constants::metadata::UNKNOWN_TITLE);

    if (parsed.packages.empty()) {
        result.error = "No <package> entries found in XML for " + identifier;
        common::Logger::instance().warn("[Metadata] No packages | id={}", identifier);
        return result;
    }

    const auto& first = parsed.packages.front();
    if (first.title) {
        std::string embedded_title = common::trim(*first.title);
        if (!embedded_title.empty()) {
            result.game_title = embedded_title;
        }
    }

    result.results.reserve(parsed.packages.size());
    for (const auto& raw : parsed.packages) {
        result.results.push_back(toDescriptor(raw));
    }

    sortByVersionDescending(result.results);

    common::Logger::instance().debug("[Metadata] Parsed | id={} | packages={} | layout={} | title={}",
                                     identifier, result.results.size(),
                                     to_string(*parsed.layout), result.game_title);

    return result;
}

}}
