#pragma once
#include "perp/ISigner.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <fstream>
#include <mutex>
#include <string>
#include <vector>

namespace client {

// Signer that signs nothing: every request is accepted, given a hash, logged
// and journaled. Used by the driver and for dry runs against fixture data.
class PaperSigner : public perp::ISigner {
public:
    PaperSigner();
    // Also append every request to `journal_path` as one JSON object per line.
    explicit PaperSigner(const std::string& journal_path);
    ~PaperSigner() override;

    std::string create_order(const perp::OrderIntent& intent) override;
    std::string cancel_all_orders(const std::string& symbol, std::int64_t timestamp_ms) override;
    std::string update_leverage(perp::MarketIndex market_index, std::uint16_t imf, perp::MarginMode mode) override;

    // copy of every request accepted so far, oldest first
    std::vector<nlohmann::json> journal() const;

    static nlohmann::json intent_to_json(const perp::OrderIntent& intent);

private:
    std::string record(nlohmann::json entry);

    mutable std::mutex mutex_;
    std::vector<nlohmann::json> journal_;
    std::ofstream journal_file_;
    std::uint64_t next_seq_{1};
};

}
