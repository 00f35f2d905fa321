#pragma once

#include <filesystem>
#include <istream>
#include <string>
#include <vector>

namespace batchfetch {

// nuScenes v1.0 full dataset: ten trainval blob archives plus metadata.
[[nodiscard]] const std::vector<std::string>& nuScenesUrls();

// One URL per line. Blank lines and lines starting with '#' are skipped,
// surrounding whitespace is trimmed.
[[nodiscard]] std::vector<std::string> parseUrlList(std::istream& in);

// Throws ConfigError when the file cannot be read or lists no URLs.
[[nodiscard]] std::vector<std::string> loadUrlList(const std::filesystem::path& path);

} // namespace batchfetch
