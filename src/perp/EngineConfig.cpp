#include "perp/EngineConfig.hpp"
#include <fstream>
#include <stdexcept>

namespace perp {

using json = nlohmann::json;

MarginMode parse_margin_mode(const std::string& s) {
    if (s == "cross") return MarginMode::Cross;
    if (s == "isolated") return MarginMode::Isolated;
    throw std::runtime_error("unknown margin mode '" + s + "'");
}

PrecisionPolicy parse_precision_policy(const std::string& s) {
    if (s == "fallback") return PrecisionPolicy::Fallback;
    if (s == "fail_closed") return PrecisionPolicy::FailClosed;
    throw std::runtime_error("unknown precision policy '" + s + "'");
}

EngineConfig EngineConfig::from_json(const json& j) {
    if (!j.is_object()) {
        throw std::runtime_error("engine config must be a JSON object");
    }

    EngineConfig cfg;
    try {
        cfg.account_index = j.value("account_index", cfg.account_index);
        cfg.quote_suffix = j.value("quote_suffix", cfg.quote_suffix);
        cfg.fallback_decimals = j.value("fallback_decimals", cfg.fallback_decimals);
        cfg.slippage = j.value("slippage", cfg.slippage);
        if (j.contains("precision_policy")) {
            cfg.precision_policy = parse_precision_policy(j.at("precision_policy").get<std::string>());
        }
        if (j.contains("margin_mode")) {
            cfg.margin_mode = parse_margin_mode(j.at("margin_mode").get<std::string>());
        }
        if (j.contains("protective_expiry_hours")) {
            cfg.protective_expiry = std::chrono::hours(j.at("protective_expiry_hours").get<long>());
        }
    } catch (const json::exception& e) {
        throw std::runtime_error(std::string("bad engine config: ") + e.what());
    }

    if (cfg.quote_suffix.empty()) {
        throw std::runtime_error("quote_suffix must not be empty");
    }
    if (cfg.fallback_decimals < 0 || cfg.fallback_decimals > kMaxDecimals) {
        throw std::runtime_error("fallback_decimals must be in [0, " + std::to_string(kMaxDecimals) + "]");
    }
    if (!(cfg.slippage >= 0.0 && cfg.slippage < 1.0)) {
        throw std::runtime_error("slippage must be in [0, 1)");
    }
    if (cfg.protective_expiry.count() <= 0) {
        throw std::runtime_error("protective_expiry_hours must be positive");
    }
    return cfg;
}

json EngineConfig::to_json() const {
    json j;
    j["account_index"] = account_index;
    j["quote_suffix"] = quote_suffix;
    j["fallback_decimals"] = fallback_decimals;
    j["precision_policy"] = precision_policy == PrecisionPolicy::Fallback ? "fallback" : "fail_closed";
    j["slippage"] = slippage;
    j["protective_expiry_hours"] = protective_expiry.count();
    j["margin_mode"] = margin_mode_to_string(margin_mode);
    return j;
}

EngineConfig load_engine_config(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw std::runtime_error("Cannot open config file: " + path);
    }
    json j;
    try {
        in >> j;
    } catch (const json::exception& e) {
        throw std::runtime_error("Failed to parse config '" + path + "': " + std::string(e.what()));
    }
    return EngineConfig::from_json(j);
}

} // namespace perp
