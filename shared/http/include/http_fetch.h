#pragma once

#include <string>

namespace sightline {

/// Blocking libcurl requests with a hard timeout. Never throws; transport
/// errors come back in Result::error.
struct HttpFetch {
    struct Result {
        bool ok = false;           // transport succeeded and status is 2xx
        long status = 0;
        std::string body;
        std::string error;
        double elapsed_seconds = 0;
    };

    static Result get(const std::string& url, long timeout_ms);

    static Result postJson(const std::string& url, const std::string& body,
                           long timeout_ms);

    /// curl_global_init / cleanup, called once from main
    static void globalInit();
    static void globalCleanup();
};

}  // namespace sightline
