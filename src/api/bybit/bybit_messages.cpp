#include "bybit_messages.hpp"
#include "trader/data_structures/trading_errors.hpp"
#include <algorithm>
#include <iomanip>
#include <sstream>

namespace BybitTrader {
namespace API {
namespace BybitMessages {

namespace {

double to_number(const json& field_value) {
    if (field_value.is_number()) {
        return field_value.get<double>();
    }
    if (field_value.is_string()) {
        const std::string& text_value = field_value.get_ref<const std::string&>();
        if (text_value.empty()) {
            return 0.0;
        }
        try {
            return std::stod(text_value);
        } catch (const std::exception&) {
            throw Core::GatewayError("Unparseable decimal in exchange response: '" + text_value + "'");
        }
    }
    return 0.0;
}

double number_field(const json& object_value, const char* field_name) {
    auto field_iterator = object_value.find(field_name);
    if (field_iterator == object_value.end() || field_iterator->is_null()) {
        return 0.0;
    }
    return to_number(*field_iterator);
}

std::string string_field(const json& object_value, const char* field_name) {
    auto field_iterator = object_value.find(field_name);
    if (field_iterator == object_value.end() || !field_iterator->is_string()) {
        return "";
    }
    return field_iterator->get<std::string>();
}

const json& require_list(const json& result, const std::string& context) {
    if (!result.is_object() || !result.contains("list") || !result["list"].is_array()) {
        throw Core::GatewayError("Missing result.list in " + context + " response");
    }
    return result["list"];
}

// triggerDirection: 1 fires when price rises to the trigger, 2 when it falls to it.
int trigger_direction(const Core::OrderRequest& request) {
    bool sell_side = request.side == Core::OrderSide::Sell;
    if (request.type == Core::OrderType::StopMarket) {
        return sell_side ? 2 : 1;
    }
    return sell_side ? 1 : 2;
}

} // namespace

std::string format_decimal(double value) {
    std::ostringstream decimal_stream;
    decimal_stream << std::fixed << std::setprecision(8) << value;
    std::string formatted = decimal_stream.str();
    formatted.erase(formatted.find_last_not_of('0') + 1);
    if (!formatted.empty() && formatted.back() == '.') {
        formatted.pop_back();
    }
    return formatted;
}

json build_order_create_body(const Core::OrderRequest& request, const std::string& category, const std::string& symbol) {
    json body;
    body["category"] = category;
    body["symbol"] = symbol;
    body["side"] = Core::to_string(request.side);
    body["qty"] = format_decimal(request.quantity);
    body["positionIdx"] = 0;

    switch (request.type) {
        case Core::OrderType::Market:
            body["orderType"] = "Market";
            break;
        case Core::OrderType::Limit:
            if (!request.price) {
                throw Core::GatewayError("Limit order requires a price");
            }
            body["orderType"] = "Limit";
            body["price"] = format_decimal(*request.price);
            body["timeInForce"] = "GTC";
            break;
        case Core::OrderType::StopMarket:
        case Core::OrderType::TakeProfitMarket:
            if (!request.trigger_price) {
                throw Core::GatewayError("Conditional order requires a trigger price");
            }
            body["orderType"] = "Market";
            body["triggerPrice"] = format_decimal(*request.trigger_price);
            body["triggerDirection"] = trigger_direction(request);
            body["triggerBy"] = "LastPrice";
            break;
    }

    if (request.reduce_only) {
        body["reduceOnly"] = true;
    }
    if (!request.client_order_id.empty()) {
        body["orderLinkId"] = request.client_order_id;
    }
    return body;
}

json build_cancel_body(const Core::OrderHandle& handle, const std::string& category, const std::string& symbol) {
    json body;
    body["category"] = category;
    body["symbol"] = symbol;
    if (!handle.order_id.empty()) {
        body["orderId"] = handle.order_id;
    } else {
        body["orderLinkId"] = handle.client_order_id;
    }
    return body;
}

json build_set_leverage_body(const std::string& category, const std::string& symbol, double leverage) {
    json body;
    body["category"] = category;
    body["symbol"] = symbol;
    body["buyLeverage"] = format_decimal(leverage);
    body["sellLeverage"] = format_decimal(leverage);
    return body;
}

json parse_response(const std::string& response_body, const std::string& operation) {
    try {
        return json::parse(response_body);
    } catch (const json::parse_error& parse_exception_error) {
        throw Core::GatewayError(operation + ": invalid JSON response: " + parse_exception_error.what());
    }
}

const json& require_success(const json& response, const std::string& operation, const std::vector<int>& accepted_codes) {
    if (!response.is_object() || !response.contains("retCode")) {
        throw Core::GatewayError(operation + ": response has no retCode");
    }
    int ret_code = response["retCode"].get<int>();
    bool accepted = ret_code == 0 ||
                    std::find(accepted_codes.begin(), accepted_codes.end(), ret_code) != accepted_codes.end();
    if (!accepted) {
        throw Core::GatewayError(operation + " failed: retCode " + std::to_string(ret_code) + " " +
                                 response.value("retMsg", std::string("")), ret_code);
    }
    static const json empty_result = json::object();
    auto result_iterator = response.find("result");
    if (result_iterator == response.end() || result_iterator->is_null()) {
        return empty_result;
    }
    return *result_iterator;
}

Core::OrderState map_order_status(const std::string& order_status) {
    if (order_status == "Filled") {
        return Core::OrderState::Filled;
    }
    if (order_status == "Rejected" || order_status == "Cancelled" || order_status == "Deactivated") {
        return Core::OrderState::Rejected;
    }
    return Core::OrderState::Pending;
}

Core::OrderHandle parse_order_handle(const json& result) {
    Core::OrderHandle handle;
    handle.order_id = string_field(result, "orderId");
    handle.client_order_id = string_field(result, "orderLinkId");
    if (handle.order_id.empty()) {
        throw Core::GatewayError("Order create response carries no orderId");
    }
    return handle;
}

std::optional<Core::OrderStatusReport> parse_order_status(const json& result) {
    const json& order_list = require_list(result, "order status");
    if (order_list.empty()) {
        return std::nullopt;
    }
    const json& order_entry = order_list.front();

    Core::OrderStatusReport report;
    std::string order_status = string_field(order_entry, "orderStatus");
    report.state = map_order_status(order_status);
    report.filled_quantity = number_field(order_entry, "cumExecQty");
    report.average_fill_price = number_field(order_entry, "avgPrice");
    std::string reject_reason = string_field(order_entry, "rejectReason");
    report.reason = reject_reason.empty() || reject_reason == "EC_NoError" ? order_status : order_status + " (" + reject_reason + ")";
    return report;
}

Core::ExchangePosition parse_position(const json& result) {
    const json& position_list = require_list(result, "position");
    for (const json& position_entry : position_list) {
        double position_size = number_field(position_entry, "size");
        if (position_size <= 0.0) {
            continue;
        }
        std::string position_side = string_field(position_entry, "side");
        Core::PositionSide side = Core::PositionSide::Flat;
        if (position_side == "Buy") {
            side = Core::PositionSide::Long;
        } else if (position_side == "Sell") {
            side = Core::PositionSide::Short;
        } else {
            throw Core::GatewayError("Position entry with size " + format_decimal(position_size) + " has side '" + position_side + "'");
        }
        return Core::ExchangePosition(side, position_size, number_field(position_entry, "avgPrice"));
    }
    return Core::ExchangePosition();
}

double parse_wallet_equity(const json& result) {
    const json& account_list = require_list(result, "wallet balance");
    if (account_list.empty()) {
        throw Core::GatewayError("Wallet balance response lists no account");
    }
    const json& account_entry = account_list.front();
    double total_equity = number_field(account_entry, "totalEquity");
    if (total_equity > 0.0) {
        return total_equity;
    }
    auto coin_iterator = account_entry.find("coin");
    if (coin_iterator != account_entry.end() && coin_iterator->is_array()) {
        for (const json& coin_entry : *coin_iterator) {
            if (string_field(coin_entry, "coin") == "USDT") {
                return number_field(coin_entry, "equity");
            }
        }
    }
    return total_equity;
}

std::vector<Core::Bar> parse_kline_list(const json& result) {
    const json& kline_list = require_list(result, "kline");
    std::vector<Core::Bar> bars;
    bars.reserve(kline_list.size());
    for (const json& kline_entry : kline_list) {
        if (!kline_entry.is_array() || kline_entry.size() < 6) {
            throw Core::GatewayError("Malformed kline entry: " + kline_entry.dump());
        }
        bars.emplace_back(static_cast<std::int64_t>(to_number(kline_entry[0])),
                          to_number(kline_entry[1]), to_number(kline_entry[2]),
                          to_number(kline_entry[3]), to_number(kline_entry[4]),
                          to_number(kline_entry[5]));
    }
    // Exchange lists newest first.
    std::sort(bars.begin(), bars.end(), [](const Core::Bar& left_bar, const Core::Bar& right_bar) {
        return left_bar.timestamp_ms < right_bar.timestamp_ms;
    });
    return bars;
}

} // namespace BybitMessages
} // namespace API
} // namespace BybitTrader
