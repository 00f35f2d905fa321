#include "batchfetch/options.hpp"

#include <exception>
#include <ostream>
#include <string>

namespace batchfetch {

namespace {

int parseInt(const std::string& option, const std::string& value, int min, int max) {
    int parsed = 0;
    std::size_t used = 0;
    try {
        parsed = std::stoi(value, &used);
    } catch (const std::exception&) {
        throw ConfigError("Invalid value for " + option + ": " + value);
    }
    if (used != value.size()) {
        throw ConfigError("Invalid value for " + option + ": " + value);
    }
    if (parsed < min || parsed > max) {
        throw ConfigError(option + " must be between " + std::to_string(min) + " and " +
                          std::to_string(max));
    }
    return parsed;
}

} // namespace

TransferOptions Options::transferOptions() const {
    TransferOptions options;
    options.chunk_size = chunk_size;
    options.connect_timeout = std::chrono::seconds(timeout_seconds);
    options.stall_timeout = std::chrono::seconds(timeout_seconds);
    return options;
}

DispatchOptions Options::dispatchOptions() const {
    DispatchOptions options;
    options.save_dir = save_dir;
    options.concurrency = threads;
    return options;
}

RetryPolicy Options::retryPolicy() const {
    RetryPolicy policy;
    policy.max_rounds = retries;
    policy.cooldown = std::chrono::seconds(cooldown_seconds);
    return policy;
}

Options parseCommandLine(int argc, const char* const* argv) {
    Options options;
    int arg_index = 1;

    while (arg_index < argc) {
        const std::string option = argv[arg_index];

        if (option == "-h" || option == "--help") {
            options.show_help = true;
            return options;
        }
        if (option == "-v" || option == "--verbose") {
            options.verbose = true;
            ++arg_index;
            continue;
        }

        if (arg_index + 1 >= argc) {
            throw ConfigError("Missing value for " + option);
        }
        const std::string value = argv[arg_index + 1];

        if (option == "--save-dir") {
            if (value.empty()) {
                throw ConfigError("--save-dir must not be empty");
            }
            options.save_dir = value;
        } else if (option == "--threads") {
            options.threads = parseInt(option, value, 1, 64);
        } else if (option == "--retries") {
            options.retries = parseInt(option, value, 0, 100);
        } else if (option == "--cooldown") {
            options.cooldown_seconds = parseInt(option, value, 0, 3600);
        } else if (option == "--timeout") {
            options.timeout_seconds = parseInt(option, value, 1, 3600);
        } else if (option == "--url-file") {
            options.url_file = value;
        } else if (option == "--log-file") {
            options.log_file = value;
        } else {
            throw ConfigError("Unknown option: " + option);
        }
        arg_index += 2;
    }

    return options;
}

void printUsage(std::ostream& out, const char* program_name) {
    out << "Usage: " << program_name << " [options]\n"
        << "Options:\n"
        << "  --save-dir <path>     Destination directory (default: nuscenes)\n"
        << "  --threads <n>         Concurrent downloads, 1-64 (default: 3)\n"
        << "  --retries <n>         Retry rounds after the first pass (default: 3)\n"
        << "  --cooldown <seconds>  Pause before each retry round (default: 2)\n"
        << "  --timeout <seconds>   Connect and stall timeout per request (default: 30)\n"
        << "  --url-file <path>     Read URLs from a file instead of the nuScenes list\n"
        << "  --log-file <path>     Also write the log to this file\n"
        << "  -v, --verbose         Debug logging\n"
        << "  -h, --help            Show this message" << std::endl;
}

void printConfigError(std::ostream& out, const ConfigError& error, const char* program_name) {
    out << "Error: " << error.what() << "\n";
    printUsage(out, program_name);
}

} // namespace batchfetch
