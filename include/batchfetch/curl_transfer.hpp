#pragma once

#include "progress.hpp"
#include "transfer.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

namespace batchfetch {

struct TransferOptions {
    std::size_t chunk_size{1024 * 1024};
    std::chrono::seconds connect_timeout{30};
    // A request that receives nothing for this long is aborted.
    std::chrono::seconds stall_timeout{30};
    std::string user_agent{"batchfetch/1.0"};
};

// Value of the Range header for a resume offset, e.g. "bytes=1024-".
[[nodiscard]] std::string rangeHeaderFor(std::uint64_t offset);

// Single-connection resumable download over libcurl.
class CurlTransfer final : public Transfer {
public:
    explicit CurlTransfer(TransferOptions options = {}, ProgressSinkPtr sink = nullptr);
    ~CurlTransfer() override;

    [[nodiscard]] bool run(const DownloadTask& task) override;

    // transfer(url, save_dir): derives the task and runs it.
    [[nodiscard]] bool fetch(const std::string& url, const std::filesystem::path& save_dir);

private:
    //使用impl类减少头文件的依赖
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace batchfetch
