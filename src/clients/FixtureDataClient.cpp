#include "clients/FixtureDataClient.hpp"
#include <cmath>
#include <fstream>
#include <iostream>
#include <stdexcept>

namespace client {

FixtureDataClient::FixtureDataClient(json document)
    : doc_(std::move(document)) {}

FixtureDataClient::json FixtureDataClient::load_document(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw std::runtime_error("Cannot open fixture file: " + path);
    }
    json doc;
    try {
        in >> doc;
    } catch (const json::exception& e) {
        throw std::runtime_error("Failed to parse fixture '" + path + "': " + std::string(e.what()));
    }
    std::cout << "[FixtureDataClient] loaded " << path << "\n";
    return doc;
}

void FixtureDataClient::set_document(json document) {
    std::lock_guard<std::mutex> lk(m_);
    doc_ = std::move(document);
}

FixtureDataClient::json FixtureDataClient::document() const {
    std::lock_guard<std::mutex> lk(m_);
    return doc_;
}

void FixtureDataClient::check_response(const json& resp, const std::string& what) {
    if (!resp.is_object()) {
        throw std::runtime_error(what + ": no response");
    }
    const int code = resp.value("code", 200);
    if (code != 200) {
        throw std::runtime_error(what + ": API error " + std::to_string(code) + " " +
                                 resp.value("message", std::string{}));
    }
}

double FixtureDataClient::number(const json& j, const char* key, double fallback) {
    auto v = optional_number(j, key);
    return v ? *v : fallback;
}

std::optional<double> FixtureDataClient::optional_number(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        return std::nullopt;
    }
    if (it->is_number()) {
        return it->get<double>();
    }
    if (it->is_string()) {
        const auto& s = it->get_ref<const std::string&>();
        if (s.empty()) return std::nullopt;
        try {
            return std::stod(s);
        } catch (const std::exception&) {
            throw std::runtime_error(std::string("field '") + key + "' is not numeric: " + s);
        }
    }
    throw std::runtime_error(std::string("field '") + key + "' has unexpected type");
}

std::optional<double> FixtureDataClient::top_of_book(const json& detail, const char* side) {
    auto it = detail.find(side);
    if (it == detail.end() || !it->is_array() || it->empty()) {
        return std::nullopt;
    }
    return optional_number(it->front(), "price");
}

std::vector<perp::MarketInfo> FixtureDataClient::list_markets() {
    const json doc = document();
    const json resp = doc.value("order_books", json{});
    check_response(resp, "orderBooks");

    std::vector<perp::MarketInfo> markets;
    try {
        for (const auto& ob : resp.at("order_books")) {
            perp::MarketInfo m;
            m.coin = ob.at("symbol").get<std::string>();
            m.market_index = ob.at("market_id").get<perp::MarketIndex>();
            m.size_decimals = ob.at("supported_size_decimals").get<int>();
            m.price_decimals = ob.at("supported_price_decimals").get<int>();
            markets.push_back(std::move(m));
        }
    } catch (const json::exception& e) {
        throw std::runtime_error(std::string("orderBooks: malformed listing: ") + e.what());
    }
    return markets;
}

std::optional<perp::RawAccount> FixtureDataClient::get_account(std::int64_t account_index) {
    const json doc = document();
    const json resp = doc.value("account", json{});
    check_response(resp, "account");

    const json accounts = resp.value("accounts", json::array());
    for (const auto& acc : accounts) {
        if (acc.value("index", std::int64_t{-1}) != account_index) continue;

        perp::RawAccount out;
        out.index = account_index;
        out.collateral = number(acc, "collateral");
        out.available_balance = number(acc, "available_balance");

        for (const auto& pos : acc.value("positions", json::array())) {
            perp::RawPosition p;
            p.market_index = pos.value("market_id", perp::MarketIndex{0});
            p.coin = pos.value("symbol", std::string{});
            // the exchange reports an unsigned size plus a direction flag; only a positive sign is long
            const double size = std::fabs(number(pos, "position"));
            p.quantity = pos.value("sign", 1) > 0 ? size : -size;
            p.avg_entry_price = number(pos, "avg_entry_price");
            p.position_value = number(pos, "position_value");
            p.mark_price = optional_number(pos, "mark_price");
            p.unrealized_pnl = number(pos, "unrealized_pnl");
            p.liquidation_price = number(pos, "liquidation_price");
            p.initial_margin_fraction = number(pos, "initial_margin_fraction");
            out.positions.push_back(std::move(p));
        }
        return out;
    }
    return std::nullopt;
}

perp::OrderBookDetail FixtureDataClient::get_order_book_detail(perp::MarketIndex market_index) {
    const json doc = document();
    const json details = doc.value("order_book_details", json::object());
    const std::string key = std::to_string(market_index);
    if (!details.contains(key)) {
        throw std::runtime_error("orderBookDetails: no book for market " + key);
    }
    const json& detail = details.at(key);
    check_response(detail, "orderBookDetails");

    perp::OrderBookDetail out;
    out.mark_price = optional_number(detail, "mark_price");
    out.best_ask = top_of_book(detail, "asks");
    out.best_bid = top_of_book(detail, "bids");
    return out;
}

} // namespace client
