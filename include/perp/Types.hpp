// types used throughout the project

#pragma once
#include <string>
#include <vector>
#include <cstdint>
#include <optional>

namespace perp {

using MarketIndex = std::uint32_t;

// ---- Market metadata ----

// Largest decimal precision the fixed-point encoding accepts; 10^18 still
// fits an int64.
constexpr int kMaxDecimals = 18;

// One listed perpetual market. `coin` is the exchange's own name ("ETH"),
// never the "ETHUSDT" form callers use.
struct MarketInfo {
    std::string coin;
    MarketIndex market_index{0};
    int         size_decimals{0};
    int         price_decimals{0};
};

// ---- Account data ----

struct AccountSnapshot {
    double wallet_balance{0.0};     // collateral minus unrealized pnl
    double available_balance{0.0};
    double unrealized_pnl{0.0};
};

enum class PositionSide {
    Long,
    Short
};

inline const char* position_side_to_string(PositionSide side) {
    switch (side) {
        case PositionSide::Long: return "long";
        case PositionSide::Short: return "short";
    }
    return "unknown";
}

struct Position {
    std::string  symbol;                    // "ETHUSDT" form
    PositionSide side{PositionSide::Long};
    double       amount{0.0};               // always >= 0, direction lives in `side`
    double       entry_price{0.0};
    double       mark_price{0.0};
    double       unrealized_pnl{0.0};
    double       liquidation_price{0.0};
    std::optional<double> leverage;         // unset when the margin fraction is not positive
};

// Account record as the data client reports it, before normalization.
struct RawPosition {
    MarketIndex market_index{0};
    std::string coin;
    double      quantity{0.0};              // signed: > 0 long, < 0 short
    double      avg_entry_price{0.0};
    double      position_value{0.0};
    std::optional<double> mark_price;
    double      unrealized_pnl{0.0};
    double      liquidation_price{0.0};
    double      initial_margin_fraction{0.0};   // percent
};

struct RawAccount {
    std::int64_t index{0};
    double collateral{0.0};
    double available_balance{0.0};
    std::vector<RawPosition> positions;
};

struct OrderBookDetail {
    std::optional<double> mark_price;
    std::optional<double> best_ask;
    std::optional<double> best_bid;
};

// ---- Orders ----

enum class OrderKind {
    Limit,
    StopLoss,
    TakeProfit
};

inline const char* order_kind_to_string(OrderKind kind) {
    switch (kind) {
        case OrderKind::Limit: return "limit";
        case OrderKind::StopLoss: return "stop_loss";
        case OrderKind::TakeProfit: return "take_profit";
    }
    return "unknown";
}

enum class TimeInForce {
    ImmediateOrCancel
};

inline const char* time_in_force_to_string(TimeInForce tif) {
    switch (tif) {
        case TimeInForce::ImmediateOrCancel: return "ioc";
    }
    return "unknown";
}

enum class MarginMode {
    Cross,
    Isolated
};

inline const char* margin_mode_to_string(MarginMode mode) {
    switch (mode) {
        case MarginMode::Cross: return "cross";
        case MarginMode::Isolated: return "isolated";
    }
    return "unknown";
}

// Fully encoded request handed to the signer. Prices and sizes are already in
// the exchange's integer units.
struct OrderIntent {
    std::string  symbol;
    MarketIndex  market_index{0};
    std::int64_t client_order_index{0};
    std::int64_t raw_quantity{0};
    std::int64_t limit_price{0};
    bool         is_ask{false};
    bool         reduce_only{false};
    OrderKind    order_type{OrderKind::Limit};
    TimeInForce  time_in_force{TimeInForce::ImmediateOrCancel};
    std::optional<std::int64_t> trigger_price;
    std::optional<std::int64_t> expiry_ms;      // unix millis
};

// The engine only ever learns that the signer accepted a request. Whether an
// IOC order filled is observable only through a later account query.
enum class OrderStatus {
    Constructed,
    Submitted
};

inline const char* order_status_to_string(OrderStatus status) {
    switch (status) {
        case OrderStatus::Constructed: return "constructed";
        case OrderStatus::Submitted: return "submitted";
    }
    return "unknown";
}

struct OrderOutcome {
    std::int64_t client_order_index{0};
    std::string  symbol;
    OrderStatus  status{OrderStatus::Constructed};
    std::string  submission_handle;
    OrderIntent  intent;
};

// Result of a multi-step workflow. Best-effort steps that failed are listed in
// `warnings` rather than aborting the workflow.
struct WorkflowResult {
    OrderOutcome order;
    std::vector<std::string> warnings;
};

} // namespace perp
