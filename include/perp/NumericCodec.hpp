#pragma once
#include "perp/Types.hpp"
#include "perp/MarketInfoCache.hpp"
#include <cstdint>
#include <string>

namespace perp {

// What to do when a symbol has no cached metadata.
enum class PrecisionPolicy {
    Fallback,       // encode at the fallback digit count and log a warning
    FailClosed      // throw ExecError(MarketNotFound)
};

/**
 * NumericCodec
 *
 * Converts decimal sizes/prices into the exchange's fixed-point integers:
 * value * 10^decimals, truncated toward zero. Truncation matches the
 * exchange's minimum-increment semantics; a size is never rounded up into an
 * amount the caller did not ask for.
 *
 * The symbol overloads only consult the cache (they never reload). Workflows
 * that already resolved a MarketInfo should use the MarketInfo overloads so
 * size and price are encoded against the same snapshot.
 */
class NumericCodec {
public:
    explicit NumericCodec(const MarketInfoCache& cache,
                          PrecisionPolicy policy = PrecisionPolicy::Fallback,
                          int fallback_decimals = 4);

    std::int64_t to_raw_size(const std::string& symbol, double quantity) const;
    std::int64_t to_raw_price(const std::string& symbol, double price) const;

    std::int64_t to_raw_size(const MarketInfo& info, double quantity) const;
    std::int64_t to_raw_price(const MarketInfo& info, double price) const;

    double from_raw_size(const std::string& symbol, std::int64_t raw) const;
    double from_raw_price(const std::string& symbol, std::int64_t raw) const;

    // Quantity truncated to the market's size precision, e.g. "0.0120".
    std::string format_quantity(const std::string& symbol, double quantity) const;

    /**
     * Scale by 10^decimals and truncate. A scaled value within a few ulps of
     * the next integer is taken as that integer, absorbing binary
     * representation error (0.29 * 100 == 28.999999999999996). Anything
     * further below the grid point truncates.
     * Throws std::invalid_argument for negative, non-finite or out-of-range
     * input, and for decimals outside [0, kMaxDecimals].
     */
    static std::int64_t scale_truncate(double value, int decimals);

    static double pow10(int decimals);

    PrecisionPolicy policy() const { return policy_; }
    int fallback_decimals() const { return fallback_decimals_; }

private:
    enum class Field { Size, Price };

    int decimals_for(const std::string& symbol, Field field) const;

    const MarketInfoCache& cache_;
    PrecisionPolicy policy_;
    int fallback_decimals_;
};

} // namespace perp
