#pragma once

#include <cstddef>

namespace quantcore {
namespace strategy {

// RSI / MACD / Bollinger / 거래량 점수 전략
struct TechnicalSignalConfig {
    int rsi_period = 14;
    int macd_fast = 12;
    int macd_slow = 26;
    int macd_signal = 9;
    int bollinger_period = 20;
    double bollinger_std_dev = 2.0;
    double volume_spike_threshold = 2.0;
};

struct MomentumConfig {
    size_t lookback = 30;
    size_t vol_window = 20;
    double target_risk = 0.02;      // 2% daily risk
    double entry_threshold = 0.0;
};

struct MeanReversionConfig {
    size_t z_score_period = 20;
    double entry_z_score = 2.0;
    double exit_z_score = 0.5;
    double stop_z_score = 3.5;
    int bollinger_period = 20;
    double bollinger_std_dev = 2.0;
    int hurst_max_lag = 20;
};

struct EnsembleConfig {
    double default_momentum_weight = 0.5;
    double default_mean_reversion_weight = 0.5;
    double action_threshold = 0.15;
};

struct PairsTradingConfig {
    size_t hedge_ratio_lookback = 60;
    size_t z_score_period = 20;
    double entry_z_score = 2.0;
    double exit_z_score = 0.5;
    double stop_z_score = 3.5;      // cointegration assumed broken beyond this
    size_t min_data_points = 60;
    int hurst_max_lag = 20;
    bool use_kalman = false;
    bool require_johansen = false;
    double kalman_delta = 1e-4;
    double kalman_ve = 1e-3;
    double kalman_initial_p = 1.0;
};

} // namespace strategy
} // namespace quantcore
