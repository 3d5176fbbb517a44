#ifndef BYBIT_REQUEST_SIGNER_HPP
#define BYBIT_REQUEST_SIGNER_HPP

#include <string>
#include <vector>

namespace BybitTrader {
namespace API {

/**
 * Bybit v5 private request authentication.
 * X-BAPI-SIGN = hex(HMAC-SHA256(secret, timestamp + api_key + recv_window + payload)),
 * where payload is the query string for GET and the raw JSON body for POST.
 */
class BybitRequestSigner {
public:
    BybitRequestSigner(const std::string& api_key, const std::string& api_secret, int recv_window_ms);

    std::string sign(const std::string& timestamp_ms, const std::string& payload) const;

    // The four X-BAPI-* header lines for one request, stamped with the current time.
    std::vector<std::string> build_auth_headers(const std::string& payload) const;
    std::vector<std::string> build_auth_headers(const std::string& payload, const std::string& timestamp_ms) const;

private:
    std::string key;
    std::string secret;
    std::string recv_window;
};

// Lower-case hex HMAC-SHA256. Throws std::runtime_error if OpenSSL fails.
std::string hmac_sha256_hex(const std::string& secret, const std::string& message);

} // namespace API
} // namespace BybitTrader

#endif // BYBIT_REQUEST_SIGNER_HPP
