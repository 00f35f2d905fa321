#include "batchfetch/curl_transfer.hpp"
#include "batchfetch/detail/curl_utils.hpp"
#include "batchfetch/logging.hpp"

#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <exception>
#include <filesystem>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

#include <curl/curl.h>

namespace batchfetch {

std::string rangeHeaderFor(std::uint64_t offset) {
    return "bytes=" + std::to_string(offset) + "-";
}

class CurlTransfer::Impl {
public:
    Impl(TransferOptions options, ProgressSinkPtr sink)
        : options_(std::move(options)),
          sink_(std::move(sink)) {
        options_.chunk_size = std::max<std::size_t>(1, options_.chunk_size);
    }

    bool run(const DownloadTask& task) {
        try {
            return download(task);
        } catch (const std::exception& ex) {
            BATCHFETCH_ERROR("Error downloading {}: {}", task.url, ex.what());
            return false;
        }
    }

private:
    struct FileDeleter {
        void operator()(FILE* fp) const noexcept {
            if (fp) {
                std::fclose(fp);
            }
        }
    };

    // Per-attempt state, lives on the worker's stack for one download.
    struct TransferContext {
        Impl* owner{nullptr};
        CURL* curl{nullptr};
        const DownloadTask* task{nullptr};
        ProgressScope* progress{nullptr};

        std::unique_ptr<FILE, FileDeleter> file{};
        std::vector<char> chunk;
        std::uint64_t offset{0};
        std::uint64_t written{0};

        bool response_checked{false};
        bool already_complete{false};
        bool truncate{false};
        std::string error;
    };

    bool download(const DownloadTask& task) {
        const std::string filename = task.destination.filename().string();
        if (filename.empty()) {
            BATCHFETCH_ERROR("Error downloading {}: URL has no file name", task.url);
            return false;
        }

        std::error_code ec;
        std::filesystem::create_directories(task.destination.parent_path(), ec);
        if (ec) {
            BATCHFETCH_ERROR("Error downloading {}: cannot create {}: {}",
                             task.url, task.destination.parent_path().string(), ec.message());
            return false;
        }

        //检查文件是否已部分下载
        std::uint64_t offset = 0;
        if (std::filesystem::exists(task.destination, ec)) {
            offset = std::filesystem::file_size(task.destination, ec);
            if (ec) {
                BATCHFETCH_ERROR("Error downloading {}: cannot stat {}: {}",
                                 task.url, task.destination.string(), ec.message());
                return false;
            }
            BATCHFETCH_INFO("Found partial file {} ({} bytes), requesting Range: {}",
                            filename, offset, rangeHeaderFor(offset));
        }

        ProgressScope progress(sink_.get(), task.url, filename, offset);

        detail::CurlHandle curl{curl_easy_init()};
        if (!curl) {
            progress.fail("Failed to allocate curl handle");
            BATCHFETCH_ERROR("Error downloading {}: failed to allocate curl handle", task.url);
            return false;
        }

        TransferContext ctx;
        ctx.owner = this;
        ctx.curl = curl.get();
        ctx.task = &task;
        ctx.progress = &progress;
        ctx.offset = offset;
        ctx.chunk.reserve(options_.chunk_size);

        char error_buffer[CURL_ERROR_SIZE] = {};
        const std::string range = std::to_string(offset) + "-";

        curl_easy_setopt(curl.get(), CURLOPT_URL, task.url.c_str());
        curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_NOPROGRESS, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_ERRORBUFFER, error_buffer);
        curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, options_.user_agent.c_str());
        curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT,
                         static_cast<long>(options_.connect_timeout.count()));
        curl_easy_setopt(curl.get(), CURLOPT_LOW_SPEED_LIMIT, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_LOW_SPEED_TIME,
                         static_cast<long>(options_.stall_timeout.count()));
        curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, &Impl::writeCallback);
        curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &ctx);
        if (offset > 0) {
            // Range: bytes=<offset>-
            curl_easy_setopt(curl.get(), CURLOPT_RANGE, range.c_str());
        }

        const CURLcode res = curl_easy_perform(curl.get());

        if (ctx.error.empty() && res != CURLE_OK) {
            ctx.error = error_buffer[0] != '\0' ? std::string{error_buffer}
                                                : std::string{curl_easy_strerror(res)};
        }
        if (ctx.error.empty() && !ctx.response_checked) {
            inspectResponse(ctx);
        }
        if (ctx.error.empty() && !ctx.already_complete) {
            finishFile(ctx);
        }

        if (!ctx.error.empty()) {
            keepReceivedBytes(ctx);
            ctx.file.reset();
            progress.fail(ctx.error);
            BATCHFETCH_ERROR("Error downloading {}: {}", task.url, ctx.error);
            return false;
        }

        progress.complete();
        if (ctx.already_complete) {
            BATCHFETCH_INFO("{} is already complete ({} bytes)", filename, ctx.offset);
        } else {
            BATCHFETCH_INFO("Finished {} ({} new bytes, {} total)",
                            filename, ctx.written, ctx.offset + ctx.written);
        }
        return true;
    }

    // Runs once per attempt, when the final response's headers are known.
    bool inspectResponse(TransferContext& ctx) {
        ctx.response_checked = true;

        long code = 0;
        curl_easy_getinfo(ctx.curl, CURLINFO_RESPONSE_CODE, &code);

        if (code == 416 && ctx.offset > 0) {
            ctx.already_complete = true;
            ctx.progress->setTotal(ctx.offset);
            return true;
        }
        if (code >= 400) {
            ctx.error = "HTTP status " + std::to_string(code);
            return false;
        }
        if (code == 200 && ctx.offset > 0) {
            BATCHFETCH_WARN("{} ignored the range request, restarting {} from zero",
                            ctx.task->url, ctx.task->destination.filename().string());
            ctx.offset = 0;
            ctx.truncate = true;
            ctx.progress->restart(0);
        }

        curl_off_t length = -1;
        curl_easy_getinfo(ctx.curl, CURLINFO_CONTENT_LENGTH_DOWNLOAD_T, &length);
        if (length >= 0) {
            ctx.progress->setTotal(static_cast<std::uint64_t>(length) + ctx.offset);
        }
        return true;
    }

    bool openFile(TransferContext& ctx) {
        //续传时追加写入, 不截断已有数据
        const char* mode = ctx.truncate ? "wb" : "ab";
        ctx.file.reset(std::fopen(ctx.task->destination.c_str(), mode));
        if (!ctx.file) {
            const std::error_code ec{errno, std::generic_category()};
            ctx.error = "Cannot open " + ctx.task->destination.string() + ": " + ec.message();
            return false;
        }
        return true;
    }

    bool flushChunk(TransferContext& ctx) {
        if (ctx.chunk.empty()) {
            return true;
        }
        if (!ctx.file && !openFile(ctx)) {
            return false;
        }

        const size_t written = std::fwrite(ctx.chunk.data(), 1, ctx.chunk.size(), ctx.file.get());
        if (written != ctx.chunk.size()) {
            const std::error_code ec{errno, std::generic_category()};
            ctx.error = "Failed to write " + ctx.task->destination.string() + ": " + ec.message();
            return false;
        }

        ctx.written += written;
        ctx.progress->advance(written);
        ctx.chunk.clear();
        return true;
    }

    void finishFile(TransferContext& ctx) {
        if (!flushChunk(ctx)) {
            return;
        }
        // An empty body still leaves the file on disk.
        if (!ctx.file && !openFile(ctx)) {
            return;
        }
        if (std::fflush(ctx.file.get()) != 0) {
            const std::error_code ec{errno, std::generic_category()};
            ctx.error = "Failed to write " + ctx.task->destination.string() + ": " + ec.message();
            return;
        }
        ctx.file.reset();
    }

    // Bytes buffered before a transport error are still valid; keep them
    // on disk so the next attempt resumes after them.
    void keepReceivedBytes(TransferContext& ctx) {
        if (ctx.chunk.empty() || ctx.already_complete) {
            return;
        }
        std::string error = std::move(ctx.error);
        ctx.error.clear();
        flushChunk(ctx);
        ctx.error = std::move(error);
    }

    static size_t writeCallback(char* ptr, size_t size, size_t nmemb, void* userdata) {
        auto* ctx = static_cast<TransferContext*>(userdata);
        if (!ctx || !ctx->owner) {
            return 0;
        }

        const size_t total = size * nmemb;
        if (!ctx->response_checked && !ctx->owner->inspectResponse(*ctx)) {
            return 0;
        }
        if (ctx->already_complete) {
            // 416的响应体不是文件内容
            return total;
        }

        const std::size_t chunk_size = ctx->owner->options_.chunk_size;
        size_t consumed = 0;
        while (consumed < total) {
            const size_t room = chunk_size - ctx->chunk.size();
            const size_t take = std::min(room, total - consumed);
            ctx->chunk.insert(ctx->chunk.end(), ptr + consumed, ptr + consumed + take);
            consumed += take;

            if (ctx->chunk.size() >= chunk_size && !ctx->owner->flushChunk(*ctx)) {
                return 0;
            }
        }
        return total;
    }

    TransferOptions options_;
    ProgressSinkPtr sink_;
};

CurlTransfer::CurlTransfer(TransferOptions options, ProgressSinkPtr sink)
    : impl_(std::make_unique<Impl>(std::move(options), std::move(sink))) {
    detail::ensureCurlInitialized();
}

CurlTransfer::~CurlTransfer() = default;

bool CurlTransfer::run(const DownloadTask& task) { return impl_->run(task); }

bool CurlTransfer::fetch(const std::string& url, const std::filesystem::path& save_dir) {
    return run(makeDownloadTask(url, save_dir));
}

} // namespace batchfetch
