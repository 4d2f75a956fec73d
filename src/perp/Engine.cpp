/*
 * The core Engine class, responsible for sequencing every exchange workflow:
 * cancel -> leverage -> market -> price -> encode -> submit.
 */

#include "perp/Engine.hpp"
#include "perp/ExecError.hpp"
#include <algorithm>
#include <chrono>
#include <cmath>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace perp {

namespace {

IMarketDataClient& require_client(const std::unique_ptr<IMarketDataClient>& client) {
    if (!client) {
        throw std::invalid_argument("Engine needs a market data client");
    }
    return *client;
}

bool valid_amount(double v) {
    return std::isfinite(v) && v > 0.0;
}

} // namespace

Engine::Engine(EngineConfig cfg, std::unique_ptr<ISigner> signer, std::unique_ptr<IMarketDataClient> data)
    : cfg_(std::move(cfg)),
      signer_(std::move(signer)),
      data_(std::move(data)),
      cache_(require_client(data_), cfg_.quote_suffix),
      codec_(cache_, cfg_.precision_policy, cfg_.fallback_decimals),
      accounts_(*data_, cfg_.account_index, cfg_.quote_suffix) {
    if (!signer_) {
        throw std::invalid_argument("Engine needs a signer");
    }

    // Warm the cache; a failure here is not fatal, lookups reload on demand.
    try {
        cache_.reload();
    } catch (const ExecError& e) {
        std::cerr << "[Engine] initial market load failed: " << e.what() << "\n";
    }
}

// ---- account ----

AccountSnapshot Engine::get_balance() {
    return accounts_.get_balance();
}

std::vector<Position> Engine::get_positions() {
    return accounts_.get_positions();
}

std::optional<Position> Engine::find_position(const std::string& symbol, PositionSide side) {
    const std::string coin = cache_.coin_for(symbol);
    for (auto& p : accounts_.get_positions()) {
        if (p.side == side && cache_.coin_for(p.symbol) == coin) {
            return p;
        }
    }
    return std::nullopt;
}

// ---- workflows ----

WorkflowResult Engine::open_long(const std::string& symbol, double quantity, int leverage) {
    return open_position(symbol, quantity, leverage, PositionSide::Long);
}

WorkflowResult Engine::open_short(const std::string& symbol, double quantity, int leverage) {
    return open_position(symbol, quantity, leverage, PositionSide::Short);
}

WorkflowResult Engine::close_long(const std::string& symbol, double quantity) {
    return close_position(symbol, quantity, PositionSide::Long);
}

WorkflowResult Engine::close_short(const std::string& symbol, double quantity) {
    return close_position(symbol, quantity, PositionSide::Short);
}

WorkflowResult Engine::set_stop_loss(const std::string& symbol, PositionSide position_side,
                                     double quantity, double stop_price) {
    return place_protective(symbol, position_side, quantity, stop_price, OrderKind::StopLoss);
}

WorkflowResult Engine::set_take_profit(const std::string& symbol, PositionSide position_side,
                                       double quantity, double take_profit_price) {
    return place_protective(symbol, position_side, quantity, take_profit_price, OrderKind::TakeProfit);
}

WorkflowResult Engine::open_position(const std::string& symbol, double quantity, int leverage, PositionSide side) {
    if (!valid_amount(quantity)) {
        throw ExecError(ErrorKind::InvalidRequest, symbol, "quantity must be positive");
    }
    if (leverage < 1) {
        throw ExecError(ErrorKind::InvalidRequest, symbol, "leverage must be >= 1");
    }

    auto lk = lock_symbol(symbol);
    WorkflowResult result;

    // 1. stale orders: best effort, a failure leaves them resting
    cancel_best_effort(symbol, result.warnings, "before open");

    // 2. leverage must be in place before any capital is at risk
    update_leverage_locked(symbol, leverage);

    // 3-4. metadata and price
    const MarketInfo info = cache_.lookup(symbol);
    const double price = price_for(info, symbol);

    // 5. marketable IOC limit, priced through the book to emulate a market order
    const bool is_ask = side == PositionSide::Short;
    const double limit = is_ask ? price * (1.0 - cfg_.slippage) : price * (1.0 + cfg_.slippage);
    const OrderIntent intent = make_intent(symbol, info, quantity, limit, is_ask, false, OrderKind::Limit);

    // 6. submit
    result.order = submit(intent);

    std::ostringstream ss;
    ss << std::fixed << std::setprecision(4);
    ss << "[Engine] open " << position_side_to_string(side) << " submitted: " << symbol
       << " qty=" << quantity << " px=" << limit << " lev=" << leverage
       << "x hash=" << result.order.submission_handle;
    std::cout << ss.str() << '\n';
    return result;
}

WorkflowResult Engine::close_position(const std::string& symbol, double quantity, PositionSide side) {
    if (!std::isfinite(quantity) || quantity < 0.0) {
        throw ExecError(ErrorKind::InvalidRequest, symbol, "quantity must be >= 0");
    }

    auto lk = lock_symbol(symbol);
    WorkflowResult result;

    if (quantity == 0.0) {
        const std::string coin = cache_.coin_for(symbol);
        for (const auto& p : accounts_.get_positions()) {
            if (p.side == side && cache_.coin_for(p.symbol) == coin) {
                quantity = p.amount;
                break;
            }
        }
        if (quantity == 0.0) {
            throw ExecError(ErrorKind::NoPositionToClose, symbol,
                            std::string("no ") + position_side_to_string(side) + " position");
        }
    }

    const MarketInfo info = cache_.lookup(symbol);
    const double price = price_for(info, symbol);

    // closing takes the opposite side, priced through the book the other way
    const bool is_ask = side == PositionSide::Long;
    const double limit = is_ask ? price * (1.0 - cfg_.slippage) : price * (1.0 + cfg_.slippage);
    const OrderIntent intent = make_intent(symbol, info, quantity, limit, is_ask, true, OrderKind::Limit);

    std::optional<ExecError> failure;
    try {
        result.order = submit(intent);
    } catch (const ExecError& e) {
        failure = e;
    }

    // protective orders of the closed position would otherwise stay resting
    cancel_best_effort(symbol, result.warnings, "after close");

    if (failure) {
        throw *failure;
    }

    std::ostringstream ss;
    ss << std::fixed << std::setprecision(4);
    ss << "[Engine] close " << position_side_to_string(side) << " submitted: " << symbol
       << " qty=" << quantity << " px=" << limit << " hash=" << result.order.submission_handle;
    std::cout << ss.str() << '\n';
    return result;
}

WorkflowResult Engine::place_protective(const std::string& symbol, PositionSide position_side,
                                        double quantity, double trigger, OrderKind kind) {
    if (!valid_amount(quantity)) {
        throw ExecError(ErrorKind::InvalidRequest, symbol, "quantity must be positive");
    }
    if (!valid_amount(trigger)) {
        throw ExecError(ErrorKind::InvalidRequest, symbol, "trigger price must be positive");
    }

    auto lk = lock_symbol(symbol);
    WorkflowResult result;

    const MarketInfo info = cache_.lookup(symbol);

    // a long is protected by a sell, a short by a buy
    const bool is_ask = position_side == PositionSide::Long;
    OrderIntent intent = make_intent(symbol, info, quantity, trigger, is_ask, true, kind);
    intent.trigger_price = intent.limit_price;
    intent.expiry_ms = now_ms() +
        std::chrono::duration_cast<std::chrono::milliseconds>(cfg_.protective_expiry).count();

    result.order = submit(intent);

    std::cout << "[Engine] " << order_kind_to_string(kind) << " set: " << symbol
              << " trigger=" << trigger << " hash=" << result.order.submission_handle << "\n";
    return result;
}

std::string Engine::set_leverage(const std::string& symbol, int leverage) {
    if (leverage < 1) {
        throw ExecError(ErrorKind::InvalidRequest, symbol, "leverage must be >= 1");
    }
    auto lk = lock_symbol(symbol);
    return update_leverage_locked(symbol, leverage);
}

std::string Engine::cancel_all_orders(const std::string& symbol) {
    auto lk = lock_symbol(symbol);
    try {
        std::string handle = signer_->cancel_all_orders(symbol, now_ms());
        std::cout << "[Engine] cancelled all orders for " << symbol << " hash=" << handle << "\n";
        return handle;
    } catch (const std::exception& e) {
        throw ExecError(ErrorKind::CancelFailed, symbol, e.what());
    }
}

void Engine::set_margin_mode(const std::string& symbol, MarginMode mode) {
    {
        std::lock_guard<std::mutex> lk(margin_m_);
        margin_modes_[cache_.coin_for(symbol)] = mode;
    }
    std::cout << "[Engine] " << symbol << " will use " << margin_mode_to_string(mode)
              << " margin (applied with the next leverage update)\n";
}

MarginMode Engine::margin_mode_for(const std::string& symbol) const {
    std::lock_guard<std::mutex> lk(margin_m_);
    auto it = margin_modes_.find(cache_.coin_for(symbol));
    return it != margin_modes_.end() ? it->second : cfg_.margin_mode;
}

// ---- market data ----

double Engine::get_market_price(const std::string& symbol) {
    return price_for(cache_.lookup(symbol), symbol);
}

std::string Engine::format_quantity(const std::string& symbol, double quantity) const {
    return codec_.format_quantity(symbol, quantity);
}

size_t Engine::reload_markets() {
    return cache_.reload();
}

// ---- steps ----

std::string Engine::update_leverage_locked(const std::string& symbol, int leverage) {
    const MarketInfo info = cache_.lookup(symbol);
    // IMF in basis points: 10x -> 1000
    const auto imf = static_cast<std::uint16_t>(10000 / std::min(leverage, 10000));
    const MarginMode mode = margin_mode_for(symbol);

    std::string handle;
    try {
        handle = signer_->update_leverage(info.market_index, imf, mode);
    } catch (const std::exception& e) {
        std::cerr << "[Engine] leverage update failed for " << symbol << ": " << e.what() << "\n";
        throw ExecError(ErrorKind::LeverageSetFailed, symbol, e.what());
    }

    std::cout << "[Engine] " << symbol << " leverage " << leverage << "x (imf=" << imf
              << ", " << margin_mode_to_string(mode) << ") hash=" << handle << "\n";
    return handle;
}

void Engine::cancel_best_effort(const std::string& symbol, std::vector<std::string>& warnings, const char* stage) {
    try {
        signer_->cancel_all_orders(symbol, now_ms());
    } catch (const std::exception& e) {
        std::string msg = std::string("cancel ") + stage + " failed: " + e.what();
        std::cerr << "[Engine] warning: " << symbol << " " << msg << "\n";
        warnings.push_back(std::move(msg));
    }
}

double Engine::price_for(const MarketInfo& info, const std::string& symbol) {
    OrderBookDetail detail;
    try {
        detail = data_->get_order_book_detail(info.market_index);
    } catch (const std::exception& e) {
        throw ExecError(ErrorKind::PriceUnavailable, symbol, e.what());
    }

    if (detail.mark_price && *detail.mark_price > 0.0) {
        return *detail.mark_price;
    }
    if (detail.best_ask && detail.best_bid && *detail.best_ask > 0.0 && *detail.best_bid > 0.0) {
        return (*detail.best_ask + *detail.best_bid) / 2.0;
    }
    throw ExecError(ErrorKind::PriceUnavailable, symbol, "no mark price and no two-sided book");
}

OrderIntent Engine::make_intent(const std::string& symbol, const MarketInfo& info, double quantity,
                                double limit_price, bool is_ask, bool reduce_only, OrderKind kind) {
    OrderIntent intent;
    intent.symbol = symbol;
    intent.market_index = info.market_index;
    intent.is_ask = is_ask;
    intent.reduce_only = reduce_only;
    intent.order_type = kind;
    intent.time_in_force = TimeInForce::ImmediateOrCancel;

    try {
        intent.raw_quantity = codec_.to_raw_size(info, quantity);
        intent.limit_price = codec_.to_raw_price(info, limit_price);
    } catch (const std::invalid_argument& e) {
        throw ExecError(ErrorKind::InvalidRequest, symbol, e.what());
    }
    if (intent.raw_quantity == 0) {
        throw ExecError(ErrorKind::InvalidRequest, symbol, "quantity is below the market's size increment");
    }

    intent.client_order_index = next_client_order_index();
    return intent;
}

OrderOutcome Engine::submit(const OrderIntent& intent) {
#ifdef PERP_DEBUG
    std::cout << "[debug] [submit] " << intent.symbol << " market=" << intent.market_index
              << " coi=" << intent.client_order_index << " size=" << intent.raw_quantity
              << " price=" << intent.limit_price << " ask=" << intent.is_ask
              << " reduce=" << intent.reduce_only << " type=" << order_kind_to_string(intent.order_type) << "\n";
#endif

    OrderOutcome out;
    out.client_order_index = intent.client_order_index;
    out.symbol = intent.symbol;
    out.intent = intent;

    try {
        out.submission_handle = signer_->create_order(intent);
    } catch (const std::exception& e) {
        std::cerr << "[Engine] order submission failed for " << intent.symbol << ": " << e.what() << "\n";
        throw ExecError(ErrorKind::OrderSubmissionFailed, intent.symbol, e.what());
    }
    out.status = OrderStatus::Submitted;
    return out;
}

std::int64_t Engine::next_client_order_index() {
    const std::int64_t now = now_ms();
    std::int64_t prev = last_client_index_.load();
    while (true) {
        const std::int64_t next = std::max(now, prev + 1);
        if (last_client_index_.compare_exchange_weak(prev, next)) {
            return next;
        }
    }
}

std::int64_t Engine::now_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

} // namespace perp
