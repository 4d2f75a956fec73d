#include <cassert>
#include <chrono>
#include <cmath>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "perp/Engine.hpp"
#include "perp/ExecError.hpp"
#include "test_fakes.hpp"

using namespace perp;
using perp::test::market;
using perp::test::mark_book;
using perp::test::raw_position;
using Calls = std::vector<std::string>;

namespace {

// Engine wired to fakes. Raw pointers are kept before ownership moves into
// the engine so the test can script and inspect them.
struct Rig {
    test::CallLog log;
    test::RecordingSigner* signer{nullptr};
    test::ScriptedDataClient* data{nullptr};
    std::unique_ptr<Engine> engine;

    explicit Rig(EngineConfig cfg = {}) {
        auto s = std::make_unique<test::RecordingSigner>(log);
        auto d = std::make_unique<test::ScriptedDataClient>(log);
        signer = s.get();
        data = d.get();
        data->markets = {market("ETH", 0, 4, 2), market("BTC", 1, 5, 1)};
        data->books[0] = mark_book(3000.0);
        data->books[1] = mark_book(60000.0);
        engine = std::make_unique<Engine>(cfg, std::move(s), std::move(d));
        log.clear();
    }
};

std::int64_t now_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

template <typename F>
ErrorKind expect_error(F&& f) {
    try {
        f();
    } catch (const ExecError& e) {
        return e.kind();
    }
    assert(false && "expected ExecError");
    return ErrorKind::InvalidRequest;
}

} // namespace

static void test_open_long_sequence_and_encoding() {
    Rig rig;
    WorkflowResult r = rig.engine->open_long("ETHUSDT", 0.01, 10);

    assert((rig.log.entries() == Calls{"cancel:ETHUSDT", "leverage:0:1000", "book:0", "order:ETHUSDT:bid"}));

    auto lev = rig.signer->leverage_calls();
    assert(lev.size() == 1 && lev[0].imf == 1000 && lev[0].mode == MarginMode::Cross);

    const OrderIntent& o = r.order.intent;
    assert(o.market_index == 0);
    assert(o.raw_quantity == 100);
    assert(o.limit_price == 303000);     // 3000 * 1.01 at 2 price decimals
    assert(!o.is_ask);
    assert(!o.reduce_only);
    assert(o.order_type == OrderKind::Limit);
    assert(o.time_in_force == TimeInForce::ImmediateOrCancel);
    assert(!o.trigger_price && !o.expiry_ms);

    assert(r.order.status == OrderStatus::Submitted);
    assert(r.order.symbol == "ETHUSDT");
    assert(r.order.client_order_index == o.client_order_index);
    assert(!r.order.submission_handle.empty());
    assert(r.warnings.empty());
}

static void test_open_short_mirrors() {
    Rig rig;
    WorkflowResult r = rig.engine->open_short("BTCUSDT", 0.002, 5);
    assert((rig.log.entries() == Calls{"cancel:BTCUSDT", "leverage:1:2000", "book:1", "order:BTCUSDT:ask"}));
    assert(r.order.intent.is_ask);
    assert(r.order.intent.raw_quantity == 200);
    assert(r.order.intent.limit_price == 594000);   // 60000 * 0.99 at 1 decimal
}

static void test_open_with_mid_price() {
    Rig rig;
    OrderBookDetail book;
    book.best_ask = 3001.0;
    book.best_bid = 2999.0;
    rig.data->books[0] = book;
    WorkflowResult r = rig.engine->open_long("ETHUSDT", 1.0, 2);
    assert(r.order.intent.limit_price == 303000);
    assert(std::fabs(rig.engine->get_market_price("ETHUSDT") - 3000.0) < 1e-9);
}

static void test_stale_cancel_failure_is_a_warning() {
    Rig rig;
    rig.signer->fail_cancels = true;
    WorkflowResult r = rig.engine->open_long("ETHUSDT", 0.01, 10);
    assert(r.order.status == OrderStatus::Submitted);
    assert(r.warnings.size() == 1);
    assert(r.warnings[0].find("cancel") != std::string::npos);
}

static void test_leverage_failure_aborts() {
    Rig rig;
    rig.signer->fail_leverage = true;
    assert(expect_error([&] { rig.engine->open_long("ETHUSDT", 0.01, 10); }) == ErrorKind::LeverageSetFailed);
    assert(rig.log.count_prefix("order:") == 0);
    assert(rig.log.count_prefix("book:") == 0);
}

static void test_price_unavailable_aborts_after_leverage() {
    Rig rig;
    OrderBookDetail one_sided;
    one_sided.best_ask = 3001.0;
    rig.data->books[0] = one_sided;
    assert(expect_error([&] { rig.engine->open_long("ETHUSDT", 0.01, 10); }) == ErrorKind::PriceUnavailable);
    // leverage already changed stays changed; nothing was submitted
    assert(rig.log.count_prefix("leverage:") == 1);
    assert(rig.log.count_prefix("order:") == 0);
}

static void test_unknown_market_aborts() {
    Rig rig;
    assert(expect_error([&] { rig.engine->open_long("DOGEUSDT", 10, 3); }) == ErrorKind::MarketNotFound);
    assert(rig.log.count_prefix("leverage:") == 0);
    assert(rig.log.count_prefix("order:") == 0);
    assert(rig.log.count_prefix("markets") == 1);   // the single on-miss reload
}

static void test_invalid_requests_have_no_side_effects() {
    Rig rig;
    assert(expect_error([&] { rig.engine->open_long("ETHUSDT", 0.0, 10); }) == ErrorKind::InvalidRequest);
    assert(expect_error([&] { rig.engine->open_short("ETHUSDT", 1.0, 0); }) == ErrorKind::InvalidRequest);
    assert(expect_error([&] { rig.engine->close_long("ETHUSDT", -1.0); }) == ErrorKind::InvalidRequest);
    assert(expect_error([&] {
        rig.engine->set_stop_loss("ETHUSDT", PositionSide::Long, 1.0, 0.0);
    }) == ErrorKind::InvalidRequest);
    assert(rig.log.entries().empty());

    // below the size increment: detected once the market is resolved
    assert(expect_error([&] { rig.engine->open_long("ETHUSDT", 0.00001, 10); }) == ErrorKind::InvalidRequest);
    assert(rig.log.count_prefix("order:") == 0);
}

static void test_close_without_position() {
    Rig rig;
    assert(expect_error([&] { rig.engine->close_long("ETHUSDT", 0); }) == ErrorKind::NoPositionToClose);
    assert(rig.log.count_prefix("order:") == 0);

    // a long does not satisfy close_short
    rig.data->account.positions = {raw_position("ETH", 0, 0.5)};
    assert(expect_error([&] { rig.engine->close_short("ETHUSDT", 0); }) == ErrorKind::NoPositionToClose);
    assert(rig.signer->orders().empty());
}

static void test_close_with_no_account_record() {
    Rig rig;
    rig.data->missing_account = true;
    assert(expect_error([&] { rig.engine->close_long("ETHUSDT", 0); }) == ErrorKind::NoPositionToClose);
    assert(rig.signer->orders().empty());
    assert((rig.log.entries() == Calls{"account"}));

    // the balance still needs the record
    assert(expect_error([&] { rig.engine->get_balance(); }) == ErrorKind::AccountUnavailable);
    assert(rig.engine->get_positions().empty());
}

static void test_close_long_full_position() {
    Rig rig;
    rig.data->account.positions = {raw_position("BTC", 1, -0.1), raw_position("ETH", 0, 0.5)};
    WorkflowResult r = rig.engine->close_long("ETHUSDT", 0);

    assert((rig.log.entries() == Calls{"account", "book:0", "order:ETHUSDT:ask", "cancel:ETHUSDT"}));
    const OrderIntent& o = r.order.intent;
    assert(o.is_ask);
    assert(o.reduce_only);
    assert(o.raw_quantity == 5000);
    assert(o.limit_price == 297000);
    assert(o.time_in_force == TimeInForce::ImmediateOrCancel);
}

static void test_close_short_explicit_quantity() {
    Rig rig;
    WorkflowResult r = rig.engine->close_short("BTCUSDT", 0.05);
    // explicit quantity: no account query
    assert((rig.log.entries() == Calls{"book:1", "order:BTCUSDT:bid", "cancel:BTCUSDT"}));
    assert(!r.order.intent.is_ask);
    assert(r.order.intent.reduce_only);
    assert(r.order.intent.raw_quantity == 5000);
    assert(r.order.intent.limit_price == 606000);
}

static void test_close_failure_still_cleans_up() {
    Rig rig;
    rig.signer->fail_orders = true;
    assert(expect_error([&] { rig.engine->close_long("ETHUSDT", 0.5); }) == ErrorKind::OrderSubmissionFailed);
    assert((rig.log.entries() == Calls{"book:0", "order:ETHUSDT:ask", "cancel:ETHUSDT"}));
}

static void test_close_cleanup_failure_is_a_warning() {
    Rig rig;
    rig.signer->fail_cancels = true;
    WorkflowResult r = rig.engine->close_long("ETHUSDT", 0.5);
    assert(r.order.status == OrderStatus::Submitted);
    assert(r.warnings.size() == 1);
}

static void test_open_submission_failure() {
    Rig rig;
    rig.signer->fail_orders = true;
    assert(expect_error([&] { rig.engine->open_long("ETHUSDT", 0.01, 10); }) == ErrorKind::OrderSubmissionFailed);
    // no compensation: leverage stays as set
    assert(rig.log.count_prefix("leverage:") == 1);
}

static void test_protective_orders() {
    Rig rig;
    const std::int64_t before = now_ms();
    WorkflowResult sl = rig.engine->set_stop_loss("ETHUSDT", PositionSide::Long, 0.5, 2800.0);
    const std::int64_t after = now_ms();

    const std::int64_t thirty_days = 30LL * 24 * 60 * 60 * 1000;
    const OrderIntent& o = sl.order.intent;
    assert(o.is_ask);                        // a long's stop is a sell
    assert(o.reduce_only);
    assert(o.order_type == OrderKind::StopLoss);
    assert(o.limit_price == 280000);
    assert(o.trigger_price && *o.trigger_price == o.limit_price);
    assert(o.expiry_ms && *o.expiry_ms >= before + thirty_days && *o.expiry_ms <= after + thirty_days);
    assert(o.raw_quantity == 5000);

    WorkflowResult tp = rig.engine->set_take_profit("BTCUSDT", PositionSide::Short, 0.01, 55000.0);
    assert(!tp.order.intent.is_ask);         // a short's take-profit is a buy
    assert(tp.order.intent.order_type == OrderKind::TakeProfit);
    assert(tp.order.intent.limit_price == 550000);

    // no cancel, no leverage, no price fetch
    assert((rig.log.entries() == Calls{"order:ETHUSDT:ask", "order:BTCUSDT:bid"}));

    rig.signer->fail_orders = true;
    assert(expect_error([&] {
        rig.engine->set_take_profit("ETHUSDT", PositionSide::Long, 0.5, 3500.0);
    }) == ErrorKind::OrderSubmissionFailed);
}

static void test_leverage_and_margin_mode() {
    EngineConfig cfg;
    cfg.margin_mode = MarginMode::Cross;
    Rig rig(cfg);

    assert(rig.engine->margin_mode_for("ETHUSDT") == MarginMode::Cross);
    rig.engine->set_margin_mode("ETHUSDT", MarginMode::Isolated);
    assert(rig.engine->margin_mode_for("ETH") == MarginMode::Isolated);
    assert(rig.engine->margin_mode_for("BTCUSDT") == MarginMode::Cross);

    std::string h = rig.engine->set_leverage("ETHUSDT", 3);
    assert(!h.empty());
    auto lev = rig.signer->leverage_calls();
    assert(lev.size() == 1);
    assert(lev[0].imf == 3333);
    assert(lev[0].mode == MarginMode::Isolated);

    rig.signer->fail_leverage = true;
    assert(expect_error([&] { rig.engine->set_leverage("ETHUSDT", 5); }) == ErrorKind::LeverageSetFailed);
}

static void test_cancel_all_orders() {
    Rig rig;
    assert(!rig.engine->cancel_all_orders("ETHUSDT").empty());
    rig.signer->fail_cancels = true;
    assert(expect_error([&] { rig.engine->cancel_all_orders("ETHUSDT"); }) == ErrorKind::CancelFailed);
}

static void test_client_order_indices_increase() {
    Rig rig;
    std::int64_t last = 0;
    for (int i = 0; i < 20; ++i) {
        WorkflowResult r = rig.engine->set_stop_loss("ETHUSDT", PositionSide::Short, 0.1, 3500.0);
        assert(r.order.client_order_index > last);
        last = r.order.client_order_index;
    }
}

static void test_queries() {
    Rig rig;
    rig.data->account.collateral = 500.0;
    rig.data->account.available_balance = 200.0;
    rig.data->account.positions = {raw_position("ETH", 0, -0.3)};
    rig.data->account.positions[0].unrealized_pnl = 20.0;
    rig.data->account.positions[0].position_value = 900.0;

    assert(std::fabs(rig.engine->get_balance().wallet_balance - 480.0) < 1e-9);
    assert(rig.engine->get_positions().size() == 1);
    auto pos = rig.engine->find_position("ETHUSDT", PositionSide::Short);
    assert(pos && std::fabs(pos->amount - 0.3) < 1e-12);
    assert(!rig.engine->find_position("ETHUSDT", PositionSide::Long));

    assert(rig.engine->format_quantity("ETHUSDT", 1.23456) == "1.2345");
    assert(rig.engine->format_quantity("UNKNOWNUSDT", 1.5) == "1.5000");

    rig.data->set_markets({market("ETH", 0, 4, 2)});
    assert(rig.engine->reload_markets() == 1);
    assert(!rig.engine->markets().try_get("BTCUSDT"));
}

int main() {
    test_open_long_sequence_and_encoding();
    test_open_short_mirrors();
    test_open_with_mid_price();
    test_stale_cancel_failure_is_a_warning();
    test_leverage_failure_aborts();
    test_price_unavailable_aborts_after_leverage();
    test_unknown_market_aborts();
    test_invalid_requests_have_no_side_effects();
    test_close_without_position();
    test_close_with_no_account_record();
    test_close_long_full_position();
    test_close_short_explicit_quantity();
    test_close_failure_still_cleans_up();
    test_close_cleanup_failure_is_a_warning();
    test_open_submission_failure();
    test_protective_orders();
    test_leverage_and_margin_mode();
    test_cancel_all_orders();
    test_client_order_indices_increase();
    test_queries();
    std::cout << "test_engine_workflows: ok\n";
    return 0;
}
