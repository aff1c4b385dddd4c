// include/sigbt/backtest/simulation_config.hpp
#pragma once

#include <optional>
#include <nlohmann/json.hpp>
#include "sigbt/core/config_base.hpp"
#include "sigbt/core/error.hpp"

namespace sigbt {
namespace backtest {

/**
 * @brief Immutable parameters of one simulation run
 *
 * Read-only once a run starts, so one instance may be shared by reference
 * across concurrently running simulations.
 */
struct SimulationConfig : public ConfigBase {
    double initial_capital{100000.0};
    double position_size{1.0};     // Fraction in (0, 1] of capital committed per trade
    double commission_pct{0.001};  // Fraction of traded notional
    double min_commission{5.0};    // Absolute floor per fill
    double slippage_pct{0.001};    // Applied against the holder on entry and exit
    std::optional<double> stop_loss_pct;
    std::optional<double> take_profit_pct;
    std::optional<int> max_holding_periods;  // Bars, not calendar time
    bool enable_compound{true};              // Size from current capital instead of initial

    /**
     * @brief Check every field against its allowed range
     * @return INVALID_CONFIG error naming the first offending field
     */
    Result<void> validate() const;

    nlohmann::json to_json() const override;
    void from_json(const nlohmann::json& j) override;
};

/**
 * @brief Parameters of the performance summary
 */
struct AnalyzerConfig : public ConfigBase {
    double risk_free_rate{0.02};         // Annual
    int trading_periods_per_year{252};   // Bars per year

    Result<void> validate() const;

    nlohmann::json to_json() const override {
        nlohmann::json j;
        j["risk_free_rate"] = risk_free_rate;
        j["trading_periods_per_year"] = trading_periods_per_year;
        return j;
    }

    void from_json(const nlohmann::json& j) override {
        if (j.contains("risk_free_rate"))
            risk_free_rate = j.at("risk_free_rate").get<double>();
        if (j.contains("trading_periods_per_year"))
            trading_periods_per_year = j.at("trading_periods_per_year").get<int>();
    }
};

}  // namespace backtest
}  // namespace sigbt
