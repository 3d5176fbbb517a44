#include "bybit_request_signer.hpp"
#include "utils/time_utils.hpp"
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace BybitTrader {
namespace API {

std::string hmac_sha256_hex(const std::string& secret, const std::string& message) {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_length = 0;

    unsigned char* hmac_result = HMAC(EVP_sha256(),
                                      secret.data(), static_cast<int>(secret.size()),
                                      reinterpret_cast<const unsigned char*>(message.data()), message.size(),
                                      digest, &digest_length);
    if (!hmac_result) {
        throw std::runtime_error("HMAC-SHA256 computation failed");
    }

    std::ostringstream hex_stream;
    for (unsigned int digest_index = 0; digest_index < digest_length; ++digest_index) {
        hex_stream << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(digest[digest_index]);
    }
    return hex_stream.str();
}

BybitRequestSigner::BybitRequestSigner(const std::string& api_key, const std::string& api_secret, int recv_window_ms)
    : key(api_key), secret(api_secret), recv_window(std::to_string(recv_window_ms)) {
    if (key.empty() || secret.empty()) {
        throw std::runtime_error("Bybit API key and secret are required for signed requests");
    }
}

std::string BybitRequestSigner::sign(const std::string& timestamp_ms, const std::string& payload) const {
    return hmac_sha256_hex(secret, timestamp_ms + key + recv_window + payload);
}

std::vector<std::string> BybitRequestSigner::build_auth_headers(const std::string& payload) const {
    return build_auth_headers(payload, std::to_string(TimeUtils::get_current_epoch_milliseconds()));
}

std::vector<std::string> BybitRequestSigner::build_auth_headers(const std::string& payload, const std::string& timestamp_ms) const {
    return {
        "X-BAPI-API-KEY: " + key,
        "X-BAPI-TIMESTAMP: " + timestamp_ms,
        "X-BAPI-RECV-WINDOW: " + recv_window,
        "X-BAPI-SIGN: " + sign(timestamp_ms, payload)
    };
}

} // namespace API
} // namespace BybitTrader
