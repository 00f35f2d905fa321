#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace batchfetch {

struct DownloadTask {
    std::string url;
    std::filesystem::path destination;
};

// Last path segment of the URL, without query string or fragment.
// Empty when the URL ends in '/' or has no path.
[[nodiscard]] std::string fileNameFromUrl(const std::string& url);

[[nodiscard]] DownloadTask makeDownloadTask(const std::string& url,
                                            const std::filesystem::path& save_dir);

// Throws ConfigError when a URL has no file name or two URLs share one.
void validateUrlList(const std::vector<std::string>& urls);

} // namespace batchfetch
