#pragma once
#include "perp/Types.hpp"
#include "perp/NumericCodec.hpp"
#include <nlohmann/json.hpp>
#include <chrono>
#include <cstdint>
#include <string>

namespace perp {

struct EngineConfig {
    std::int64_t    account_index{0};
    std::string     quote_suffix{"USDT"};
    int             fallback_decimals{4};
    PrecisionPolicy precision_policy{PrecisionPolicy::Fallback};
    double          slippage{0.01};             // marketable-limit offset, 0.01 = 1%
    std::chrono::hours protective_expiry{24 * 30};
    MarginMode      margin_mode{MarginMode::Cross};

    /**
     * Build from a JSON object. Missing keys keep their defaults.
     * Throws std::runtime_error on bad values or wrong types.
     */
    static EngineConfig from_json(const nlohmann::json& j);

    nlohmann::json to_json() const;
};

/**
 * Read and parse a JSON config file.
 * Throws std::runtime_error if the file cannot be read or parsed.
 */
EngineConfig load_engine_config(const std::string& path);

MarginMode parse_margin_mode(const std::string& s);
PrecisionPolicy parse_precision_policy(const std::string& s);

} // namespace perp
