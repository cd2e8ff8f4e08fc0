#include "ps3_update/common/format.hpp"
#include "ps3_update/common/constants.hpp"
#include <spdlog/fmt/fmt.h>
#include <array>
#include <cctype>
#include <sstream>

namespace ps3_update {
namespace common {

namespace {

constexpr std::array<const char*, 5> SIZE_UNITS = {"B", "KB", "MB", "GB", "TB"};

std::string formatScaled(double value) {
    size_t unit = 0;
    while (value >= 1024.0 && unit < SIZE_UNITS.size() - 1) {
        value /= 1024.0;
        ++unit;
    }
    return fmt::format("{:.2f} {}", value, SIZE_UNITS[unit]);
}

bool isAsciiAlnum(char c) {
    unsigned char uc = static_cast<unsigned char>(c);
    return uc < 0x80 && std::isalnum(uc);
}

}

std::string formatSize(uint64_t bytes) {
    if (bytes == 0) {
        return "Unknown";
    }
    return formatScaled(static_cast<double>(bytes));
}

std::string formatRate(double bytes_per_second) {
    if (bytes_per_second <= 0.0) {
        return "0 B/s";
    }
    return formatScaled(bytes_per_second) + "/s";
}

std::string normalizeIdentifier(const std::string& raw) {
    std::string cleaned;
    cleaned.reserve(raw.size());
    for (char c : raw) {
        if (isAsciiAlnum(c)) {
            cleaned.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
        }
    }
    return cleaned;
}

std::string safeDirName(const std::string& raw) {
    std::string replaced;
    replaced.reserve(raw.size());
    for (char c : raw) {
        if (isAsciiAlnum(c) || c == ' ' || c == '-' || c == '_') {
            replaced.push_back(c);
        } else {
            replaced.push_back(' ');
        }
    }

    std::istringstream words(replaced);
    std::string word;
    std::string collapsed;
    while (words >> word) {
        if (!collapsed.empty()) {
            collapsed += ' ';
        }
        collapsed += word;
    }

    if (collapsed.empty()) {
        return constants::metadata::DEFAULT_FOLDER;
    }

    if (collapsed.size() > constants::metadata::MAX_FOLDER_NAME_LENGTH) {
        collapsed.resize(constants::metadata::MAX_FOLDER_NAME_LENGTH);
    }
    return collapsed;
}

std::string sanitizeFolderName(const std::string& raw) {
    std::string sanitized = raw;
    for (char& c : sanitized) {
        switch (c) {
            case '/': case '\\': case ':': case '*': case '?':
            case '"': case '<': case '>': case '|':
                c = '_';
                break;
            default:
                break;
        }
    }
    return sanitized;
}

std::string packageFolderName(const std::string& title, const std::string& identifier) {
    return sanitizeFolderName(title + " (" + identifier + ")");
}

std::string filenameFromUrl(const std::string& url) {
    auto slash = url.find_last_of('/');
    std::string name = (slash == std::string::npos) ? url : url.substr(slash + 1);
    if (name.empty()) {
        return constants::metadata::DEFAULT_FILENAME;
    }
    return name;
}

std::string trim(const std::string& text) {
    size_t begin = 0;
    size_t end = text.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(text[begin]))) ++begin;
    while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1]))) --end;
    return text.substr(begin, end - begin);
}

}}
