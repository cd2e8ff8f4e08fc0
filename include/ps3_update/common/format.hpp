#pragma once

#include <string>
#include <cstdint>

namespace ps3_update {
namespace common {

// "Unknown" for zero, otherwise two decimals with a binary unit (B, KB, MB, GB, TB).
std::string formatSize(uint64_t bytes);

// "0 B/s" for zero, otherwise formatSize-style units with a "/s" suffix.
std::string formatRate(double bytes_per_second);

// Keeps ASCII alphanumerics and uppercases them: "bles-00779" -> "BLES00779".
std::string normalizeIdentifier(const std::string& raw);

std::string safeDirName(const std::string& raw);

std::string sanitizeFolderName(const std::string& raw);

// "<title> (<id>)" with path separators and reserved characters replaced.
std::string packageFolderName(const std::string& title, const std::string& identifier);

std::string filenameFromUrl(const std::string& url);

std::string trim(const std::string& text);

}}
