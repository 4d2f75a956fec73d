#include "perp/NumericCodec.hpp"
#include "perp/ExecError.hpp"
#include <cmath>
#include <iomanip>
#include <iostream>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace perp {

namespace {

// Largest double that still converts safely to int64.
constexpr double kMaxRaw = 9.2e18;
// A few ulps: enough for the error of one decimal-to-binary conversion and one
// multiplication, far below any real sub-increment remainder.
constexpr double kGridTolerance = 16 * std::numeric_limits<double>::epsilon();

} // namespace

NumericCodec::NumericCodec(const MarketInfoCache& cache, PrecisionPolicy policy, int fallback_decimals)
    : cache_(cache), policy_(policy), fallback_decimals_(fallback_decimals) {
    if (fallback_decimals_ < 0 || fallback_decimals_ > kMaxDecimals) {
        throw std::invalid_argument("fallback decimals out of range");
    }
}

double NumericCodec::pow10(int decimals) {
    double multiplier = 1.0;
    for (int i = 0; i < decimals; ++i) {
        multiplier *= 10.0;
    }
    return multiplier;
}

std::int64_t NumericCodec::scale_truncate(double value, int decimals) {
    if (!std::isfinite(value) || value < 0.0) {
        throw std::invalid_argument("cannot encode value " + std::to_string(value));
    }
    if (decimals < 0 || decimals > kMaxDecimals) {
        throw std::invalid_argument("unsupported precision " + std::to_string(decimals));
    }
    const double scaled = value * pow10(decimals);
    if (scaled >= kMaxRaw) {
        throw std::invalid_argument("value " + std::to_string(value) + " overflows raw units");
    }
    double truncated = std::trunc(scaled);
    if ((truncated + 1.0) - scaled <= scaled * kGridTolerance) {
        truncated += 1.0;
    }
    return static_cast<std::int64_t>(truncated);
}

int NumericCodec::decimals_for(const std::string& symbol, Field field) const {
    if (auto info = cache_.try_get(symbol)) {
        return field == Field::Size ? info->size_decimals : info->price_decimals;
    }
    if (policy_ == PrecisionPolicy::FailClosed) {
        throw ExecError(ErrorKind::MarketNotFound, symbol, "no metadata to encode with");
    }
    // Deliberate: unknown markets are encoded at a fixed precision instead of
    // failing. Wrong units reach the exchange if its real precision differs.
    std::cerr << "[NumericCodec] warning: no metadata for " << symbol
              << ", encoding with " << fallback_decimals_ << " decimals\n";
    return fallback_decimals_;
}

std::int64_t NumericCodec::to_raw_size(const std::string& symbol, double quantity) const {
    return scale_truncate(quantity, decimals_for(symbol, Field::Size));
}

std::int64_t NumericCodec::to_raw_price(const std::string& symbol, double price) const {
    return scale_truncate(price, decimals_for(symbol, Field::Price));
}

std::int64_t NumericCodec::to_raw_size(const MarketInfo& info, double quantity) const {
    return scale_truncate(quantity, info.size_decimals);
}

std::int64_t NumericCodec::to_raw_price(const MarketInfo& info, double price) const {
    return scale_truncate(price, info.price_decimals);
}

double NumericCodec::from_raw_size(const std::string& symbol, std::int64_t raw) const {
    return static_cast<double>(raw) / pow10(decimals_for(symbol, Field::Size));
}

double NumericCodec::from_raw_price(const std::string& symbol, std::int64_t raw) const {
    return static_cast<double>(raw) / pow10(decimals_for(symbol, Field::Price));
}

std::string NumericCodec::format_quantity(const std::string& symbol, double quantity) const {
    const int decimals = decimals_for(symbol, Field::Size);
    const std::int64_t raw = scale_truncate(quantity, decimals);
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(decimals)
       << static_cast<double>(raw) / pow10(decimals);
    return ss.str();
}

} // namespace perp
