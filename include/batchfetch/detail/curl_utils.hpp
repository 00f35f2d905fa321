#pragma once

#include <memory>

#include <curl/curl.h>

namespace batchfetch::detail {

void ensureCurlInitialized();

struct CurlDeleter {
    void operator()(CURL* curl) const noexcept {
        if (curl) {
            curl_easy_cleanup(curl);
        }
    }
};

using CurlHandle = std::unique_ptr<CURL, CurlDeleter>;

} // namespace batchfetch::detail
