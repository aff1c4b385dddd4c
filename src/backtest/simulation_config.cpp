// src/backtest/simulation_config.cpp
#include "sigbt/backtest/simulation_config.hpp"
#include <cmath>
#include <string>

namespace sigbt {
namespace backtest {

namespace {

Result<void> config_error(const std::string& message) {
    return make_error<void>(ErrorCode::INVALID_CONFIG, message, "SimulationConfig");
}

template <typename T>
void read_optional(const nlohmann::json& j, const char* key, std::optional<T>& field) {
    if (!j.contains(key))
        return;
    if (j.at(key).is_null()) {
        field.reset();
    } else {
        field = j.at(key).get<T>();
    }
}

template <typename T>
nlohmann::json optional_to_json(const std::optional<T>& field) {
    return field ? nlohmann::json(*field) : nlohmann::json(nullptr);
}

}  // namespace

Result<void> SimulationConfig::validate() const {
    if (!std::isfinite(initial_capital) || initial_capital <= 0.0) {
        return config_error("initial_capital must be positive, got " +
                            std::to_string(initial_capital));
    }
    if (!std::isfinite(position_size) || position_size <= 0.0 || position_size > 1.0) {
        return config_error("position_size must be in (0, 1], got " +
                            std::to_string(position_size));
    }
    if (!std::isfinite(commission_pct) || commission_pct < 0.0) {
        return config_error("commission_pct must be non-negative, got " +
                            std::to_string(commission_pct));
    }
    if (!std::isfinite(min_commission) || min_commission < 0.0) {
        return config_error("min_commission must be non-negative, got " +
                            std::to_string(min_commission));
    }
    if (!std::isfinite(slippage_pct) || slippage_pct < 0.0) {
        return config_error("slippage_pct must be non-negative, got " +
                            std::to_string(slippage_pct));
    }
    if (stop_loss_pct && (!std::isfinite(*stop_loss_pct) || *stop_loss_pct <= 0.0)) {
        return config_error("stop_loss_pct must be positive when set, got " +
                            std::to_string(*stop_loss_pct));
    }
    if (take_profit_pct && (!std::isfinite(*take_profit_pct) || *take_profit_pct <= 0.0)) {
        return config_error("take_profit_pct must be positive when set, got " +
                            std::to_string(*take_profit_pct));
    }
    if (max_holding_periods && *max_holding_periods <= 0) {
        return config_error("max_holding_periods must be positive when set, got " +
                            std::to_string(*max_holding_periods));
    }
    return Result<void>();
}

nlohmann::json SimulationConfig::to_json() const {
    nlohmann::json j;
    j["initial_capital"] = initial_capital;
    j["position_size"] = position_size;
    j["commission_pct"] = commission_pct;
    j["min_commission"] = min_commission;
    j["slippage_pct"] = slippage_pct;
    j["stop_loss_pct"] = optional_to_json(stop_loss_pct);
    j["take_profit_pct"] = optional_to_json(take_profit_pct);
    j["max_holding_periods"] = optional_to_json(max_holding_periods);
    j["enable_compound"] = enable_compound;
    return j;
}

void SimulationConfig::from_json(const nlohmann::json& j) {
    if (j.contains("initial_capital"))
        initial_capital = j.at("initial_capital").get<double>();
    if (j.contains("position_size"))
        position_size = j.at("position_size").get<double>();
    if (j.contains("commission_pct"))
        commission_pct = j.at("commission_pct").get<double>();
    if (j.contains("min_commission"))
        min_commission = j.at("min_commission").get<double>();
    if (j.contains("slippage_pct"))
        slippage_pct = j.at("slippage_pct").get<double>();
    read_optional(j, "stop_loss_pct", stop_loss_pct);
    read_optional(j, "take_profit_pct", take_profit_pct);
    read_optional(j, "max_holding_periods", max_holding_periods);
    if (j.contains("enable_compound"))
        enable_compound = j.at("enable_compound").get<bool>();
}

Result<void> AnalyzerConfig::validate() const {
    if (!std::isfinite(risk_free_rate) || risk_free_rate <= -1.0) {
        return make_error<void>(ErrorCode::INVALID_CONFIG,
                                "risk_free_rate must be greater than -1, got " +
                                    std::to_string(risk_free_rate),
                                "AnalyzerConfig");
    }
    if (trading_periods_per_year <= 0) {
        return make_error<void>(ErrorCode::INVALID_CONFIG,
                                "trading_periods_per_year must be positive, got " +
                                    std::to_string(trading_periods_per_year),
                                "AnalyzerConfig");
    }
    return Result<void>();
}

}  // namespace backtest
}  // namespace sigbt
