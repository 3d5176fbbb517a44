#include "bybit_execution_gateway.hpp"
#include "bybit_messages.hpp"
#include "trader/data_structures/trading_errors.hpp"
#include "utils/http_utils.hpp"
#include <stdexcept>

namespace BybitTrader {
namespace API {

using BybitMessages::json;

namespace {
    const char* ORDER_CREATE_ENDPOINT = "/v5/order/create";
    const char* ORDER_CANCEL_ENDPOINT = "/v5/order/cancel";
    const char* ORDER_REALTIME_ENDPOINT = "/v5/order/realtime";
    const char* ORDER_HISTORY_ENDPOINT = "/v5/order/history";
    const char* POSITION_LIST_ENDPOINT = "/v5/position/list";
    const char* WALLET_BALANCE_ENDPOINT = "/v5/account/wallet-balance";
    const char* SET_LEVERAGE_ENDPOINT = "/v5/position/set-leverage";
}

BybitExecutionGateway::BybitExecutionGateway(const Config::SystemConfig& system_config, Core::ConnectivityManager& connectivity_mgr)
    : config(system_config),
      connectivity_manager(connectivity_mgr),
      signer(system_config.api.api_key, system_config.api.api_secret, system_config.api.recv_window_ms) {
    if (config.api.active_base_url().empty()) {
        throw std::runtime_error("Bybit base URL is required but not provided");
    }
    if (config.strategy.symbol.empty()) {
        throw std::runtime_error("Symbol is required for the Bybit gateway");
    }
}

std::string BybitExecutionGateway::get_gateway_name() const {
    return config.api.testnet ? "bybit-v5-testnet" : "bybit-v5-mainnet";
}

std::string BybitExecutionGateway::build_url(const std::string& endpoint) const {
    return config.api.active_base_url() + endpoint;
}

std::string BybitExecutionGateway::signed_get(const std::string& endpoint, const std::string& query_string) const {
    Core::HttpRequest http_request(build_url(endpoint) + "?" + query_string, config.api.retry_count,
                                   config.api.timeout_seconds, config.api.enable_ssl_verification,
                                   config.api.rate_limit_delay_ms);
    http_request.headers = signer.build_auth_headers(query_string);
    try {
        return Core::http_get(http_request, connectivity_manager);
    } catch (const std::runtime_error& transport_error) {
        throw Core::GatewayError(std::string("GET ") + endpoint + ": " + transport_error.what());
    }
}

std::string BybitExecutionGateway::signed_post(const std::string& endpoint, const std::string& json_body) const {
    Core::HttpRequest http_request(build_url(endpoint), config.api.retry_count,
                                   config.api.timeout_seconds, config.api.enable_ssl_verification,
                                   config.api.rate_limit_delay_ms);
    http_request.body = json_body;
    http_request.headers = signer.build_auth_headers(json_body);
    try {
        return Core::http_post(http_request, connectivity_manager);
    } catch (const std::runtime_error& transport_error) {
        throw Core::GatewayError(std::string("POST ") + endpoint + ": " + transport_error.what());
    }
}

Core::OrderHandle BybitExecutionGateway::submit_order(const Core::OrderRequest& request) {
    if (request.quantity <= 0.0) {
        throw Core::GatewayError("Order quantity must be positive");
    }
    json body = BybitMessages::build_order_create_body(request, config.api.category, config.strategy.symbol);
    json response = BybitMessages::parse_response(signed_post(ORDER_CREATE_ENDPOINT, body.dump()), "order create");
    Core::OrderHandle handle = BybitMessages::parse_order_handle(BybitMessages::require_success(response, "order create"));
    if (handle.client_order_id.empty()) {
        handle.client_order_id = request.client_order_id;
    }
    return handle;
}

void BybitExecutionGateway::cancel_order(const Core::OrderHandle& handle) {
    if (handle.empty()) {
        throw Core::GatewayError("Cannot cancel an order without an id");
    }
    json body = BybitMessages::build_cancel_body(handle, config.api.category, config.strategy.symbol);
    json response = BybitMessages::parse_response(signed_post(ORDER_CANCEL_ENDPOINT, body.dump()), "order cancel");
    // Already filled, triggered or cancelled: nothing left to cancel.
    BybitMessages::require_success(response, "order cancel", {BybitMessages::RET_CODE_ORDER_NOT_EXISTS});
}

Core::OrderStatusReport BybitExecutionGateway::query_order_status(const Core::OrderHandle& handle) {
    std::string query_string = "category=" + config.api.category + "&symbol=" + config.strategy.symbol;
    query_string += handle.order_id.empty() ? "&orderLinkId=" + handle.client_order_id : "&orderId=" + handle.order_id;

    json realtime_response = BybitMessages::parse_response(signed_get(ORDER_REALTIME_ENDPOINT, query_string), "order status");
    std::optional<Core::OrderStatusReport> report =
        BybitMessages::parse_order_status(BybitMessages::require_success(realtime_response, "order status"));
    if (report) {
        return *report;
    }

    // Closed orders eventually leave the realtime endpoint.
    json history_response = BybitMessages::parse_response(signed_get(ORDER_HISTORY_ENDPOINT, query_string), "order history");
    report = BybitMessages::parse_order_status(BybitMessages::require_success(history_response, "order history"));
    if (report) {
        return *report;
    }

    Core::OrderStatusReport not_visible_report;
    not_visible_report.state = Core::OrderState::Pending;
    not_visible_report.reason = "order not visible yet";
    return not_visible_report;
}

Core::ExchangePosition BybitExecutionGateway::query_position() {
    std::string query_string = "category=" + config.api.category + "&symbol=" + config.strategy.symbol;
    json response = BybitMessages::parse_response(signed_get(POSITION_LIST_ENDPOINT, query_string), "position list");
    return BybitMessages::parse_position(BybitMessages::require_success(response, "position list"));
}

double BybitExecutionGateway::query_account_equity() {
    std::string query_string = "accountType=" + config.api.account_type;
    json response = BybitMessages::parse_response(signed_get(WALLET_BALANCE_ENDPOINT, query_string), "wallet balance");
    return BybitMessages::parse_wallet_equity(BybitMessages::require_success(response, "wallet balance"));
}

void BybitExecutionGateway::configure_leverage(double leverage) {
    json body = BybitMessages::build_set_leverage_body(config.api.category, config.strategy.symbol, leverage);
    json response = BybitMessages::parse_response(signed_post(SET_LEVERAGE_ENDPOINT, body.dump()), "set leverage");
    BybitMessages::require_success(response, "set leverage", {BybitMessages::RET_CODE_LEVERAGE_NOT_MODIFIED});
}

} // namespace API
} // namespace BybitTrader
