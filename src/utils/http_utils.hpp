#ifndef HTTP_UTILS_HPP
#define HTTP_UTILS_HPP

#include <string>
#include <vector>
#include "connectivity_manager.hpp"

namespace BybitTrader {
namespace Core {

// HTTP request wrapper to avoid multi-parameter functions
struct HttpRequest {
    std::string url;
    std::vector<std::string> headers;  // "Name: value" lines
    std::string body;                  // for POST; leave empty for GET
    int retries;
    int timeout_seconds;
    bool enable_ssl_verification;
    int rate_limit_delay_ms;

    HttpRequest(const std::string& request_url,
                int retry_count = 3,
                int timeout = 10,
                bool ssl_verify = true,
                int rate_delay = 100)
        : url(request_url), retries(retry_count), timeout_seconds(timeout),
          enable_ssl_verification(ssl_verify), rate_limit_delay_ms(rate_delay) {}
};

size_t write_callback(void* contents, size_t size, size_t nmemb, std::string* response_string);

// Both throw std::runtime_error when every retry fails, when the connectivity
// manager is backing off, or when the server answers with an HTTP error status.
std::string http_get(const HttpRequest& http_request, ConnectivityManager& connectivity_ref);
std::string http_post(const HttpRequest& http_request, ConnectivityManager& connectivity_ref);

// Process-wide libcurl setup; call once from main before any thread starts.
void initialize_http_transport();
void shutdown_http_transport();

} // namespace Core
} // namespace BybitTrader

#endif // HTTP_UTILS_HPP
