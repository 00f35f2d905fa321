#pragma once

#include <stdexcept>
#include <string>

namespace batchfetch {

// Bad command line, URL list or save directory. Raised before any
// download starts.
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& message) : std::runtime_error(message) {}
};

} // namespace batchfetch
