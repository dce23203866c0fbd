#pragma once

#include <cstddef>

namespace quantcore {
namespace backtest {

struct BacktestConfig {
    double initial_balance = 100000.0;
    size_t lookback = 30;               // single-asset window (bars)
    size_t pairs_lookback = 60;         // pairs window (bars)
    double min_confidence = 0.1;        // entry requires confidence > this
    int monte_carlo_iterations = 1000;
    bool use_regime_sizing = false;     // RegimeDetector -> regime Kelly
    double risk_free_rate = 0.0;        // annual
};

} // namespace backtest
} // namespace quantcore
