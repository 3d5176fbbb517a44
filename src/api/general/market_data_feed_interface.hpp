#ifndef MARKET_DATA_FEED_INTERFACE_HPP
#define MARKET_DATA_FEED_INTERFACE_HPP

#include "trader/data_structures/data_structures.hpp"
#include <memory>
#include <string>
#include <vector>

namespace BybitTrader {
namespace API {

// Closed bars for one symbol and interval, oldest first.
class MarketDataFeedInterface {
public:
    virtual ~MarketDataFeedInterface() = default;

    // Up to bar_count of the most recent closed bars. Marks them delivered.
    virtual std::vector<Core::Bar> fetch_history(int bar_count) = 0;

    // Closed bars newer than anything delivered so far; empty when nothing new.
    virtual std::vector<Core::Bar> poll_new_bars() = 0;

    virtual std::string get_feed_name() const = 0;
};

using MarketDataFeedPtr = std::unique_ptr<MarketDataFeedInterface>;

} // namespace API
} // namespace BybitTrader

#endif // MARKET_DATA_FEED_INTERFACE_HPP
