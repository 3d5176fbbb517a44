#include "http_utils.hpp"
#include <chrono>
#include <thread>
#include <curl/curl.h>
#include <stdexcept>

namespace BybitTrader {
namespace Core {

size_t write_callback(void* contents, size_t size, size_t nmemb, std::string* response_string) {
    response_string->append(static_cast<char*>(contents), size * nmemb);
    return size * nmemb;
}

void initialize_http_transport() {
    if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
        throw std::runtime_error("Failed to initialize libcurl global state");
    }
}

void shutdown_http_transport() {
    curl_global_cleanup();
}

namespace {

// Owns the easy handle and header list for the duration of one request.
struct CurlRequestGuard {
    CURL* curl_handle = nullptr;
    struct curl_slist* headers = nullptr;

    CurlRequestGuard() : curl_handle(curl_easy_init()) {}
    ~CurlRequestGuard() {
        if (headers) curl_slist_free_all(headers);
        if (curl_handle) curl_easy_cleanup(curl_handle);
    }
    CurlRequestGuard(const CurlRequestGuard&) = delete;
    CurlRequestGuard& operator=(const CurlRequestGuard&) = delete;
};

std::string perform_request(const HttpRequest& http_request, ConnectivityManager& connectivity_ref, bool is_post) {
    const std::string method_name = is_post ? "POST" : "GET";

    if (!connectivity_ref.should_attempt_connection()) {
        throw std::runtime_error("Connectivity check failed - status: " + connectivity_ref.get_status_string() +
                                 ", retry in " + std::to_string(connectivity_ref.get_seconds_until_retry()) + "s");
    }

    CurlRequestGuard request_guard;
    if (!request_guard.curl_handle) {
        throw std::runtime_error("Failed to initialize CURL for HTTP " + method_name + " request");
    }

    for (const std::string& header_line : http_request.headers) {
        request_guard.headers = curl_slist_append(request_guard.headers, header_line.c_str());
    }
    if (is_post) {
        request_guard.headers = curl_slist_append(request_guard.headers, "Content-Type: application/json");
    }

    std::string response;
    CURL* curl_handle = request_guard.curl_handle;
    curl_easy_setopt(curl_handle, CURLOPT_URL, http_request.url.c_str());
    curl_easy_setopt(curl_handle, CURLOPT_HTTPHEADER, request_guard.headers);
    curl_easy_setopt(curl_handle, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl_handle, CURLOPT_WRITEDATA, &response);
    curl_easy_setopt(curl_handle, CURLOPT_TIMEOUT, static_cast<long>(http_request.timeout_seconds));
    curl_easy_setopt(curl_handle, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl_handle, CURLOPT_SSL_VERIFYPEER, http_request.enable_ssl_verification ? 1L : 0L);
    curl_easy_setopt(curl_handle, CURLOPT_SSL_VERIFYHOST, http_request.enable_ssl_verification ? 2L : 0L);
    if (is_post) {
        curl_easy_setopt(curl_handle, CURLOPT_POSTFIELDS, http_request.body.c_str());
    }

    CURLcode curl_result = CURLE_OK;
    long http_response_code = 0;
    int attempts = http_request.retries > 0 ? http_request.retries : 1;

    for (int retry_attempt = 0; retry_attempt < attempts; ++retry_attempt) {
        response.clear();
        curl_result = curl_easy_perform(curl_handle);
        curl_easy_getinfo(curl_handle, CURLINFO_RESPONSE_CODE, &http_response_code);

        if (curl_result == CURLE_OK) {
            break;
        }

        connectivity_ref.report_failure("HTTP " + method_name + " retry " + std::to_string(retry_attempt + 1) + "/" +
                                        std::to_string(attempts) + " failed: " + curl_easy_strerror(curl_result));

        if (retry_attempt < attempts - 1) {
            std::this_thread::sleep_for(std::chrono::milliseconds(http_request.rate_limit_delay_ms));
        }
    }

    if (curl_result != CURLE_OK) {
        throw std::runtime_error("HTTP " + method_name + " failed after " + std::to_string(attempts) + " retries. " +
                                 "Last error: " + std::string(curl_easy_strerror(curl_result)) +
                                 " URL: " + http_request.url);
    }

    connectivity_ref.report_success();

    if (http_response_code >= 400) {
        throw std::runtime_error("HTTP " + method_name + " returned status " + std::to_string(http_response_code) +
                                 " for URL: " + http_request.url + " body: " + response);
    }
    if (response.empty()) {
        throw std::runtime_error("HTTP " + method_name + " succeeded but returned empty response (HTTP " +
                                 std::to_string(http_response_code) + ") for URL: " + http_request.url);
    }
    return response;
}

} // namespace

std::string http_get(const HttpRequest& http_request, ConnectivityManager& connectivity_ref) {
    return perform_request(http_request, connectivity_ref, false);
}

std::string http_post(const HttpRequest& http_request, ConnectivityManager& connectivity_ref) {
    return perform_request(http_request, connectivity_ref, true);
}

} // namespace Core
} // namespace BybitTrader
