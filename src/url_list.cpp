#include "batchfetch/url_list.hpp"
#include "batchfetch/errors.hpp"

#include <fstream>

namespace batchfetch {

const std::vector<std::string>& nuScenesUrls() {
    static const std::vector<std::string> urls{
        "https://motional-nuscenes.s3.amazonaws.com/public/v1.0/v1.0-trainval01_blobs.tgz",
        "https://motional-nuscenes.s3.amazonaws.com/public/v1.0/v1.0-trainval02_blobs.tgz",
        "https://motional-nuscenes.s3.amazonaws.com/public/v1.0/v1.0-trainval03_blobs.tgz",
        "https://motional-nuscenes.s3.amazonaws.com/public/v1.0/v1.0-trainval04_blobs.tgz",
        "https://motional-nuscenes.s3.amazonaws.com/public/v1.0/v1.0-trainval05_blobs.tgz",
        "https://motional-nuscenes.s3.amazonaws.com/public/v1.0/v1.0-trainval06_blobs.tgz",
        "https://motional-nuscenes.s3.amazonaws.com/public/v1.0/v1.0-trainval07_blobs.tgz",
        "https://motional-nuscenes.s3.amazonaws.com/public/v1.0/v1.0-trainval08_blobs.tgz",
        "https://motional-nuscenes.s3.amazonaws.com/public/v1.0/v1.0-trainval09_blobs.tgz",
        "https://motional-nuscenes.s3.amazonaws.com/public/v1.0/v1.0-trainval10_blobs.tgz",
        "https://d36yt3mvayqw5m.cloudfront.net/public/v1.0/v1.0-trainval_meta.tgz",
    };
    return urls;
}

std::vector<std::string> parseUrlList(std::istream& in) {
    std::vector<std::string> urls;
    std::string line;
    while (std::getline(in, line)) {
        const auto first = line.find_first_not_of(" \t\r\n");
        if (first == std::string::npos || line[first] == '#') {
            continue;
        }
        const auto last = line.find_last_not_of(" \t\r\n");
        urls.push_back(line.substr(first, last - first + 1));
    }
    return urls;
}

std::vector<std::string> loadUrlList(const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in) {
        throw ConfigError("Cannot read URL file: " + path.string());
    }

    auto urls = parseUrlList(in);
    if (urls.empty()) {
        throw ConfigError("URL file lists no URLs: " + path.string());
    }
    return urls;
}

} // namespace batchfetch
