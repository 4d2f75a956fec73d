#pragma once
#include "perp/Types.hpp"
#include <optional>
#include <vector>
#include <cstdint>

/*
The interface that data clients -- the classes that fetch market listings, account
records and order books from the exchange -- inherit. Every call is a fresh fetch;
failures are thrown.
*/

namespace perp {

class IMarketDataClient {
public:
    virtual ~IMarketDataClient() = default;

    // Full market listing. Coins are the exchange's own names ("ETH").
    virtual std::vector<MarketInfo> list_markets() = 0;

    // std::nullopt when the exchange has no record for the index.
    virtual std::optional<RawAccount> get_account(std::int64_t account_index) = 0;

    virtual OrderBookDetail get_order_book_detail(MarketIndex market_index) = 0;
};

}
