#pragma once

#include "AccountReader.hpp"
#include "EngineConfig.hpp"
#include "IMarketDataClient.hpp"
#include "ISigner.hpp"
#include "MarketInfoCache.hpp"
#include "NumericCodec.hpp"
#include "SymbolLocks.hpp"
#include "Types.hpp"

#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

/*
 * The order-execution engine: turns "open a 10x long of 0.01 ETHUSDT" into the
 * ordered sequence of cancel / leverage / price / submit calls the exchange
 * needs, encoded in its integer units.
 *
 * Every mutating operation holds the per-symbol lock for its whole duration,
 * so two workflows on one market never interleave. Nothing is retried and
 * nothing is rolled back: if leverage was updated and the order then fails,
 * leverage stays changed.
 */

namespace perp {

class Engine {
public:
    Engine(EngineConfig cfg, std::unique_ptr<ISigner> signer, std::unique_ptr<IMarketDataClient> data);

    // ---- account ----
    AccountSnapshot get_balance();
    std::vector<Position> get_positions();

    // Fresh account query for one position. A submitted order has only been
    // accepted; this is how a caller confirms that exposure actually changed.
    std::optional<Position> find_position(const std::string& symbol, PositionSide side);

    // ---- workflows ----
    WorkflowResult open_long(const std::string& symbol, double quantity, int leverage);
    WorkflowResult open_short(const std::string& symbol, double quantity, int leverage);

    // quantity == 0 closes the whole position on that side
    WorkflowResult close_long(const std::string& symbol, double quantity);
    WorkflowResult close_short(const std::string& symbol, double quantity);

    WorkflowResult set_stop_loss(const std::string& symbol, PositionSide position_side,
                                 double quantity, double stop_price);
    WorkflowResult set_take_profit(const std::string& symbol, PositionSide position_side,
                                   double quantity, double take_profit_price);

    // Returns the submission handle.
    std::string set_leverage(const std::string& symbol, int leverage);
    std::string cancel_all_orders(const std::string& symbol);

    // Margin mode travels with the leverage transaction; this only records the
    // mode used by the next leverage update on the symbol.
    void set_margin_mode(const std::string& symbol, MarginMode mode);
    MarginMode margin_mode_for(const std::string& symbol) const;

    // ---- market data ----
    double get_market_price(const std::string& symbol);
    std::string format_quantity(const std::string& symbol, double quantity) const;
    size_t reload_markets();

    MarketInfoCache& markets() { return cache_; }
    const NumericCodec& codec() const { return codec_; }
    const EngineConfig& config() const { return cfg_; }

private:
    WorkflowResult open_position(const std::string& symbol, double quantity, int leverage, PositionSide side);
    WorkflowResult close_position(const std::string& symbol, double quantity, PositionSide side);
    WorkflowResult place_protective(const std::string& symbol, PositionSide position_side,
                                    double quantity, double trigger, OrderKind kind);

    std::string update_leverage_locked(const std::string& symbol, int leverage);
    void cancel_best_effort(const std::string& symbol, std::vector<std::string>& warnings, const char* stage);
    double price_for(const MarketInfo& info, const std::string& symbol);
    OrderIntent make_intent(const std::string& symbol, const MarketInfo& info, double quantity,
                            double limit_price, bool is_ask, bool reduce_only, OrderKind kind);
    OrderOutcome submit(const OrderIntent& intent);

    std::unique_lock<std::mutex> lock_symbol(const std::string& symbol) {
        return locks_.acquire(cache_.coin_for(symbol));
    }

    std::int64_t next_client_order_index();
    static std::int64_t now_ms();

    EngineConfig cfg_;
    std::unique_ptr<ISigner> signer_;
    std::unique_ptr<IMarketDataClient> data_;
    MarketInfoCache cache_;
    NumericCodec codec_;
    AccountReader accounts_;
    SymbolLocks locks_;

    mutable std::mutex margin_m_;
    std::unordered_map<std::string, MarginMode> margin_modes_;   // by coin

    std::atomic<std::int64_t> last_client_index_{0};
};

}
