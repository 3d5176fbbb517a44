#ifndef BYBIT_MESSAGES_HPP
#define BYBIT_MESSAGES_HPP

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>
#include "trader/data_structures/data_structures.hpp"

namespace BybitTrader {
namespace API {

// Bybit v5 request bodies and response decoding. Decimal fields travel as strings both ways.
namespace BybitMessages {

using json = nlohmann::json;

// Set-leverage answers 110043 when the value is already in place.
constexpr int RET_CODE_LEVERAGE_NOT_MODIFIED = 110043;
// Cancel answers 110001 when the order already filled, triggered or was cancelled.
constexpr int RET_CODE_ORDER_NOT_EXISTS = 110001;

std::string format_decimal(double value);

json build_order_create_body(const Core::OrderRequest& request, const std::string& category, const std::string& symbol);
json build_cancel_body(const Core::OrderHandle& handle, const std::string& category, const std::string& symbol);
json build_set_leverage_body(const std::string& category, const std::string& symbol, double leverage);

// Throws GatewayError on malformed JSON.
json parse_response(const std::string& response_body, const std::string& operation);

// Throws GatewayError (carrying retCode and retMsg) unless retCode is 0 or listed in accepted_codes.
const json& require_success(const json& response, const std::string& operation, const std::vector<int>& accepted_codes = {});

Core::OrderState map_order_status(const std::string& order_status);
Core::OrderHandle parse_order_handle(const json& result);
// nullopt when the order is not listed (not visible yet, or aged out of the endpoint).
std::optional<Core::OrderStatusReport> parse_order_status(const json& result);
Core::ExchangePosition parse_position(const json& result);
double parse_wallet_equity(const json& result);
// All candles in the response, oldest first.
std::vector<Core::Bar> parse_kline_list(const json& result);

} // namespace BybitMessages

} // namespace API
} // namespace BybitTrader

#endif // BYBIT_MESSAGES_HPP
