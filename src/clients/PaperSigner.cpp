#include "clients/PaperSigner.hpp"
#include <functional>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace client {

using json = nlohmann::json;

PaperSigner::PaperSigner() = default;

PaperSigner::PaperSigner(const std::string& journal_path)
    : journal_file_(journal_path, std::ios::app) {
    if (!journal_file_) {
        throw std::runtime_error("Cannot open signer journal: " + journal_path);
    }
}

PaperSigner::~PaperSigner() = default;

json PaperSigner::intent_to_json(const perp::OrderIntent& intent) {
    json j;
    j["symbol"] = intent.symbol;
    j["market_index"] = intent.market_index;
    j["client_order_index"] = intent.client_order_index;
    j["base_amount"] = intent.raw_quantity;
    j["price"] = intent.limit_price;
    j["is_ask"] = intent.is_ask;
    j["reduce_only"] = intent.reduce_only;
    j["type"] = perp::order_kind_to_string(intent.order_type);
    j["time_in_force"] = perp::time_in_force_to_string(intent.time_in_force);
    j["trigger_price"] = intent.trigger_price ? json(*intent.trigger_price) : json(nullptr);
    j["order_expiry"] = intent.expiry_ms ? json(*intent.expiry_ms) : json(nullptr);
    return j;
}

std::string PaperSigner::record(json entry) {
    std::lock_guard<std::mutex> lk(mutex_);
    const std::uint64_t seq = next_seq_++;
    entry["seq"] = seq;

    // deterministic per session: same requests in the same order, same hashes
    const std::size_t digest = std::hash<std::string>{}(entry.dump());
    std::ostringstream ss;
    ss << "0x" << std::hex << std::setw(16) << std::setfill('0') << digest;
    entry["hash"] = ss.str();

    if (journal_file_.is_open()) {
        journal_file_ << entry.dump() << '\n';
        journal_file_.flush();
    }
    journal_.push_back(entry);
    return entry["hash"].get<std::string>();
}

std::string PaperSigner::create_order(const perp::OrderIntent& intent) {
    json entry;
    entry["tx"] = "create_order";
    entry["order"] = intent_to_json(intent);
    std::string hash = record(std::move(entry));
    std::cout << "[PaperSigner] order " << intent.symbol << " coi=" << intent.client_order_index
              << (intent.is_ask ? " ask " : " bid ") << intent.raw_quantity << " @ " << intent.limit_price
              << (intent.reduce_only ? " reduce-only" : "") << " -> " << hash << '\n';
    return hash;
}

std::string PaperSigner::cancel_all_orders(const std::string& symbol, std::int64_t timestamp_ms) {
    json entry;
    entry["tx"] = "cancel_all_orders";
    entry["symbol"] = symbol;
    entry["time"] = timestamp_ms;
    std::string hash = record(std::move(entry));
    std::cout << "[PaperSigner] cancel all (" << symbol << ") -> " << hash << '\n';
    return hash;
}

std::string PaperSigner::update_leverage(perp::MarketIndex market_index, std::uint16_t imf, perp::MarginMode mode) {
    json entry;
    entry["tx"] = "update_leverage";
    entry["market_index"] = market_index;
    entry["initial_margin_fraction"] = imf;
    entry["margin_mode"] = perp::margin_mode_to_string(mode);
    std::string hash = record(std::move(entry));
    std::cout << "[PaperSigner] leverage market=" << market_index << " imf=" << imf << " -> " << hash << '\n';
    return hash;
}

std::vector<json> PaperSigner::journal() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return journal_;
}

} // namespace client
