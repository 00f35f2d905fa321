#include "batchfetch/download_task.hpp"
#include "batchfetch/errors.hpp"

#include <map>

namespace batchfetch {

std::string fileNameFromUrl(const std::string& url) {
    std::string path = url.substr(0, url.find_first_of("?#"));

    const auto scheme = path.find("://");
    if (scheme != std::string::npos) {
        const auto path_start = path.find('/', scheme + 3);
        if (path_start == std::string::npos) {
            return {};
        }
        path = path.substr(path_start);
    }

    const auto slash = path.find_last_of('/');
    std::string name = slash == std::string::npos ? path : path.substr(slash + 1);
    if (name == "." || name == "..") {
        return {};
    }
    return name;
}

DownloadTask makeDownloadTask(const std::string& url, const std::filesystem::path& save_dir) {
    return DownloadTask{url, save_dir / fileNameFromUrl(url)};
}

void validateUrlList(const std::vector<std::string>& urls) {
    std::map<std::string, std::string> owners;
    for (const auto& url : urls) {
        const auto name = fileNameFromUrl(url);
        if (name.empty()) {
            throw ConfigError("URL has no file name: " + url);
        }

        const auto [it, inserted] = owners.emplace(name, url);
        if (!inserted && it->second != url) {
            throw ConfigError("URLs " + it->second + " and " + url +
                              " would both be saved as " + name);
        }
    }
}

} // namespace batchfetch
