#include "perp/MarketInfoCache.hpp"
#include "perp/ExecError.hpp"
#include <iostream>
#include <utility>

namespace perp {

MarketInfoCache::MarketInfoCache(IMarketDataClient& client, std::string quote_suffix)
    : client_(client),
      quote_suffix_(std::move(quote_suffix)),
      snapshot_(std::make_shared<const Snapshot>()) {}

std::string MarketInfoCache::coin_for(const std::string& symbol) const {
    const size_t n = quote_suffix_.size();
    if (symbol.size() > n && symbol.compare(symbol.size() - n, n, quote_suffix_) == 0) {
        return symbol.substr(0, symbol.size() - n);
    }
    return symbol;
}

std::shared_ptr<const MarketInfoCache::Snapshot> MarketInfoCache::snapshot() const {
    std::lock_guard<std::mutex> lk(snapshot_m_);
    return snapshot_;
}

std::optional<MarketInfo> MarketInfoCache::try_get(const std::string& symbol) const {
    auto snap = snapshot();
    auto it = snap->find(coin_for(symbol));
    if (it == snap->end()) {
        return std::nullopt;
    }
    return it->second;
}

MarketInfo MarketInfoCache::lookup(const std::string& symbol) {
    if (auto hit = try_get(symbol)) {
        return *hit;
    }

    std::cout << "[MarketInfoCache] " << symbol << " not cached, reloading markets\n";
    try {
        reload();
    } catch (const ExecError& e) {
        throw ExecError(ErrorKind::MarketNotFound, symbol, e.what());
    }

    if (auto hit = try_get(symbol)) {
        return *hit;
    }
    throw ExecError(ErrorKind::MarketNotFound, symbol, "no market for coin " + coin_for(symbol));
}

size_t MarketInfoCache::reload() {
    std::lock_guard<std::mutex> reload_lk(reload_m_);

    std::vector<MarketInfo> markets;
    try {
        markets = client_.list_markets();
    } catch (const std::exception& e) {
        std::cerr << "[MarketInfoCache] market listing failed: " << e.what() << "\n";
        throw ExecError(ErrorKind::MetadataReloadFailed, "", e.what());
    }

    auto next = std::make_shared<Snapshot>();
    next->reserve(markets.size());
    for (const auto& m : markets) {
        if (m.size_decimals < 0 || m.price_decimals < 0 ||
            m.size_decimals > kMaxDecimals || m.price_decimals > kMaxDecimals) {
            std::cerr << "[MarketInfoCache] rejecting listing: " << m.coin
                      << " has decimals outside [0, " << kMaxDecimals << "]\n";
            throw ExecError(ErrorKind::MetadataReloadFailed, m.coin, "decimal precision out of range");
        }
        if (!next->insert_or_assign(m.coin, m).second) {
            std::cerr << "[MarketInfoCache] duplicate listing for " << m.coin
                      << ", keeping market " << m.market_index << "\n";
        }
    }

    const size_t count = next->size();
    {
        std::lock_guard<std::mutex> lk(snapshot_m_);
        snapshot_ = std::move(next);
    }

    std::cout << "[MarketInfoCache] loaded " << count << " markets\n";
    return count;
}

} // namespace perp
