#include "http_fetch.h"

#include <curl/curl.h>

#include <chrono>

namespace sightline {

// libcurl write callback
static size_t curlWriteCallback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* response = static_cast<std::string*>(userdata);
    response->append(ptr, size * nmemb);
    return size * nmemb;
}

static HttpFetch::Result perform(const std::string& url, const std::string* post_body,
                                 long timeout_ms) {
    HttpFetch::Result result;
    auto t0 = std::chrono::steady_clock::now();

    CURL* curl = curl_easy_init();
    if (!curl) {
        result.error = "curl_easy_init failed";
        return result;
    }

    struct curl_slist* headers = nullptr;
    headers = curl_slist_append(headers, "Accept: application/json");

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    if (post_body) {
        headers = curl_slist_append(headers, "Content-Type: application/json");
        curl_easy_setopt(curl, CURLOPT_POST, 1L);
        curl_easy_setopt(curl, CURLOPT_POSTFIELDS, post_body->c_str());
        curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(post_body->size()));
    }
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, curlWriteCallback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &result.body);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, timeout_ms);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, timeout_ms);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);  // Thread-safe

    CURLcode res = curl_easy_perform(curl);
    if (res == CURLE_OK) {
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &result.status);
        result.ok = result.status >= 200 && result.status < 300;
        if (!result.ok) result.error = "HTTP " + std::to_string(result.status);
    } else {
        result.error = curl_easy_strerror(res);
    }

    curl_slist_free_all(headers);
    curl_easy_cleanup(curl);

    result.elapsed_seconds = std::chrono::duration<double>(
        std::chrono::steady_clock::now() - t0).count();
    return result;
}

HttpFetch::Result HttpFetch::get(const std::string& url, long timeout_ms) {
    return perform(url, nullptr, timeout_ms);
}

HttpFetch::Result HttpFetch::postJson(const std::string& url, const std::string& body,
                                      long timeout_ms) {
    return perform(url, &body, timeout_ms);
}

void HttpFetch::globalInit() {
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

void HttpFetch::globalCleanup() {
    curl_global_cleanup();
}

}  // namespace sightline
