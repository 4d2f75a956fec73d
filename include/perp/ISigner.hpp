#pragma once
#include "perp/Types.hpp"
#include <string>
#include <cstdint>

/*
the interface through which the engine hands fully encoded requests to whatever
signs and submits them. Every call returns the submission handle (tx hash) and
throws on failure. A returned handle means "accepted for submission", never
"filled".
*/

namespace perp {
class ISigner {
public:
    virtual std::string create_order(const OrderIntent& intent) = 0;

    // Cancels every resting order on the account. `symbol` is passed for
    // logging/journaling; the exchange primitive is account wide.
    virtual std::string cancel_all_orders(const std::string& symbol, std::int64_t timestamp_ms) = 0;

    // `imf` is the initial margin fraction in basis points (10000 / leverage).
    virtual std::string update_leverage(MarketIndex market_index, std::uint16_t imf, MarginMode mode) = 0;

    virtual ~ISigner() = default;
};

} // namespace perp
