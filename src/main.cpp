#include "batchfetch/curl_transfer.hpp"
#include "batchfetch/detail/curl_utils.hpp"
#include "batchfetch/dispatcher.hpp"
#include "batchfetch/download_task.hpp"
#include "batchfetch/errors.hpp"
#include "batchfetch/logging.hpp"
#include "batchfetch/options.hpp"
#include "batchfetch/progress_panel.hpp"
#include "batchfetch/retry_orchestrator.hpp"
#include "batchfetch/url_list.hpp"

#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <system_error>
#include <vector>

#include <unistd.h>

namespace {

constexpr int kExitConfigError = 1;
constexpr int kExitDownloadsFailed = 2;

} // namespace

int main(int argc, char** argv) {
    batchfetch::Options options;
    try {
        options = batchfetch::parseCommandLine(argc, argv);
    } catch (const batchfetch::ConfigError& ex) {
        batchfetch::printConfigError(std::cerr, ex, argv[0]);
        return kExitConfigError;
    }
    if (options.show_help) {
        batchfetch::printUsage(std::cout, argv[0]);
        return EXIT_SUCCESS;
    }

    auto panel = std::make_shared<batchfetch::ConsolePanel>(std::cout, isatty(STDOUT_FILENO) != 0);
    spdlog::sink_ptr console_sink;
    if (panel->interactive()) {
        console_sink = std::make_shared<batchfetch::PanelLogSink>(panel);
    }
    batchfetch::Logger::instance().initialize(
        options.verbose ? batchfetch::Logger::Level::Debug : batchfetch::Logger::Level::Info,
        options.log_file.string(), console_sink);

    try {
        batchfetch::detail::ensureCurlInitialized();

        std::vector<std::string> urls = options.url_file.empty()
            ? batchfetch::nuScenesUrls()
            : batchfetch::loadUrlList(options.url_file);
        batchfetch::validateUrlList(urls);

        std::error_code ec;
        std::filesystem::create_directories(options.save_dir, ec);
        if (ec) {
            throw batchfetch::ConfigError("Failed to create download directory: " +
                                          options.save_dir.string() + " - " + ec.message());
        }

        BATCHFETCH_INFO("Downloading {} file(s) into {}", urls.size(),
                        std::filesystem::absolute(options.save_dir).string());
        BATCHFETCH_INFO("Parallel downloads: {}", options.threads);

        batchfetch::CurlTransfer transfer(options.transferOptions(), panel);
        batchfetch::Dispatcher dispatcher(transfer, options.dispatchOptions());
        batchfetch::RetryOrchestrator orchestrator(dispatcher, options.retryPolicy());

        const auto still_failed = orchestrator.run(urls);
        panel->stop();

        if (!still_failed.empty()) {
            std::cout << "\nThe following " << still_failed.size() << " file(s) failed to download:\n";
            for (const auto& url : still_failed) {
                std::cout << "- " << url << "\n";
            }
            std::cout << std::flush;
            return kExitDownloadsFailed;
        }

        std::cout << "\nAll files downloaded successfully." << std::endl;
    } catch (const batchfetch::ConfigError& ex) {
        panel->stop();
        batchfetch::printConfigError(std::cerr, ex, argv[0]);
        return kExitConfigError;
    } catch (const std::exception& ex) {
        panel->stop();
        std::cerr << "Fatal error: " << ex.what() << std::endl;
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
