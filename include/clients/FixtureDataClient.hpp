#pragma once
#include "perp/IMarketDataClient.hpp"
#include <nlohmann/json.hpp>
#include <mutex>
#include <optional>
#include <string>

namespace client {

/**
 * FixtureDataClient
 *
 * Data client backed by a JSON document holding the exchange's REST responses,
 * so the engine can be driven without a network:
 *
 * {
 *   "order_books": { "code": 200, "order_books": [
 *       { "symbol": "ETH", "market_id": 0,
 *         "supported_size_decimals": 4, "supported_price_decimals": 2 } ] },
 *   "account": { "code": 200, "accounts": [
 *       { "index": 1, "collateral": "1000.0", "available_balance": "800.0",
 *         "positions": [ { "market_id": 0, "symbol": "ETH", "sign": 1,
 *                          "position": "0.5", "avg_entry_price": "2900",
 *                          "position_value": "1500", "unrealized_pnl": "50",
 *                          "liquidation_price": "2500",
 *                          "initial_margin_fraction": "10.00" } ] } ] },
 *   "order_book_details": { "0": { "mark_price": "3000",
 *       "asks": [ { "price": "3001" } ], "bids": [ { "price": "2999" } ] } }
 * }
 *
 * Numeric fields are accepted as strings (the exchange's format) or numbers.
 * Every call parses the current document afresh; set_document() swaps it,
 * which is how tests model the exchange changing between calls.
 */
class FixtureDataClient : public perp::IMarketDataClient {
public:
    using json = nlohmann::json;

    explicit FixtureDataClient(json document);

    /**
     * Read a fixture document from a file.
     * Throws std::runtime_error if it cannot be read or parsed.
     */
    static json load_document(const std::string& path);

    std::vector<perp::MarketInfo> list_markets() override;
    std::optional<perp::RawAccount> get_account(std::int64_t account_index) override;
    perp::OrderBookDetail get_order_book_detail(perp::MarketIndex market_index) override;

    void set_document(json document);

private:
    json document() const;

    static void check_response(const json& resp, const std::string& what);
    static double number(const json& j, const char* key, double fallback = 0.0);
    static std::optional<double> optional_number(const json& j, const char* key);
    static std::optional<double> top_of_book(const json& detail, const char* side);

    mutable std::mutex m_;
    json doc_;
};

} // namespace client
