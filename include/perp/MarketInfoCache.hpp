#pragma once
#include "perp/Types.hpp"
#include "perp/IMarketDataClient.hpp"
#include <unordered_map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace perp {

/**
 * MarketInfoCache
 *
 * Per-coin market metadata (market index, size/price decimals) used for every
 * encoding decision. The cache holds one immutable snapshot; reload() builds a
 * complete replacement map and publishes it in one step, so readers see either
 * the old listing or the new one, never a mix. Delisted markets disappear on
 * the next successful reload.
 */
class MarketInfoCache {
public:
    using Snapshot = std::unordered_map<std::string, MarketInfo>;

    explicit MarketInfoCache(IMarketDataClient& client, std::string quote_suffix = "USDT");

    /**
     * Resolve metadata for a "COINUSDT" symbol.
     * A miss triggers one synchronous reload and a second look.
     * Throws ExecError(MarketNotFound) if the coin is still unknown or the
     * reload failed.
     */
    MarketInfo lookup(const std::string& symbol);

    /**
     * Look in the current snapshot only. Never reloads.
     */
    std::optional<MarketInfo> try_get(const std::string& symbol) const;

    /**
     * Fetch the full market list and replace the snapshot.
     * Returns the number of markets published.
     * Throws ExecError(MetadataReloadFailed); the previous snapshot stays live.
     */
    size_t reload();

    /**
     * Strip the quote suffix: "ETHUSDT" -> "ETH". Symbols that are not longer
     * than the suffix, or do not end with it, are returned unchanged.
     */
    std::string coin_for(const std::string& symbol) const;

    std::shared_ptr<const Snapshot> snapshot() const;

    size_t size() const {
        return snapshot()->size();
    }

    const std::string& quote_suffix() const { return quote_suffix_; }

private:
    IMarketDataClient& client_;
    std::string quote_suffix_;

    mutable std::mutex snapshot_m_;             // guards the pointer, not the map
    std::shared_ptr<const Snapshot> snapshot_;
    std::mutex reload_m_;                       // one reload in flight at a time
};

}
