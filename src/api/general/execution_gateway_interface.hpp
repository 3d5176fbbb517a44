#ifndef EXECUTION_GATEWAY_INTERFACE_HPP
#define EXECUTION_GATEWAY_INTERFACE_HPP

#include "trader/data_structures/data_structures.hpp"
#include <memory>
#include <string>

namespace BybitTrader {
namespace API {

/**
 * Order placement, cancellation and state queries for the configured symbol.
 * Every call may throw Core::GatewayError.
 */
class ExecutionGatewayInterface {
public:
    virtual ~ExecutionGatewayInterface() = default;

    virtual Core::OrderHandle submit_order(const Core::OrderRequest& request) = 0;
    virtual void cancel_order(const Core::OrderHandle& handle) = 0;
    virtual Core::OrderStatusReport query_order_status(const Core::OrderHandle& handle) = 0;
    virtual Core::ExchangePosition query_position() = 0;
    virtual double query_account_equity() = 0;

    virtual std::string get_gateway_name() const = 0;
};

using ExecutionGatewayPtr = std::unique_ptr<ExecutionGatewayInterface>;

} // namespace API
} // namespace BybitTrader

#endif // EXECUTION_GATEWAY_INTERFACE_HPP
