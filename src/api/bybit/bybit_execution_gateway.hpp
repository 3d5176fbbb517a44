#ifndef BYBIT_EXECUTION_GATEWAY_HPP
#define BYBIT_EXECUTION_GATEWAY_HPP

#include "api/general/execution_gateway_interface.hpp"
#include "configs/system_config.hpp"
#include "utils/connectivity_manager.hpp"
#include "bybit_request_signer.hpp"
#include <string>

namespace BybitTrader {
namespace API {

// Signed Bybit v5 REST calls for one linear perpetual symbol.
class BybitExecutionGateway : public ExecutionGatewayInterface {
private:
    const Config::SystemConfig& config;
    Core::ConnectivityManager& connectivity_manager;
    BybitRequestSigner signer;

    std::string signed_get(const std::string& endpoint, const std::string& query_string) const;
    std::string signed_post(const std::string& endpoint, const std::string& json_body) const;
    std::string build_url(const std::string& endpoint) const;

public:
    BybitExecutionGateway(const Config::SystemConfig& system_config, Core::ConnectivityManager& connectivity_mgr);

    Core::OrderHandle submit_order(const Core::OrderRequest& request) override;
    void cancel_order(const Core::OrderHandle& handle) override;
    Core::OrderStatusReport query_order_status(const Core::OrderHandle& handle) override;
    Core::ExchangePosition query_position() override;
    double query_account_equity() override;

    std::string get_gateway_name() const override;

    // Applies risk.leverage to both sides of the symbol. "Not modified" counts as success.
    void configure_leverage(double leverage);
};

} // namespace API
} // namespace BybitTrader

#endif // BYBIT_EXECUTION_GATEWAY_HPP
