#pragma once

#include "curl_transfer.hpp"
#include "dispatcher.hpp"
#include "errors.hpp"
#include "retry_orchestrator.hpp"

#include <cstddef>
#include <filesystem>
#include <iosfwd>
#include <string>

namespace batchfetch {

struct Options {
    std::filesystem::path save_dir{"nuscenes"};
    int threads{3};
    int retries{3};
    int cooldown_seconds{2};
    int timeout_seconds{30};
    std::size_t chunk_size{1024 * 1024};
    std::filesystem::path url_file;
    std::filesystem::path log_file;
    bool verbose{false};
    bool show_help{false};

    [[nodiscard]] TransferOptions transferOptions() const;
    [[nodiscard]] DispatchOptions dispatchOptions() const;
    [[nodiscard]] RetryPolicy retryPolicy() const;
};

// Throws ConfigError on unknown options, missing values or values out of range.
[[nodiscard]] Options parseCommandLine(int argc, const char* const* argv);

void printUsage(std::ostream& out, const char* program_name);

// "Error: <message>" followed by the usage text.
void printConfigError(std::ostream& out, const ConfigError& error, const char* program_name);

} // namespace batchfetch
