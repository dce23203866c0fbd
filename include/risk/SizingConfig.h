#pragma once

#include <cstddef>

namespace quantcore {
namespace risk {

struct PositionSizerConfig {
    double max_position_pct = 0.10;     // 일반 포지션 상한 (포트폴리오 대비)
    double max_yolo_pct = 0.25;         // 고확신 포지션 상한 / 최종 clamp
    double yolo_threshold = 0.85;       // confidence 이상이면 yolo 사이징
    double kelly_fraction = 0.33;       // 1/3 Kelly
    double min_position_value = 100.0;
    double max_drawdown_scale = 0.50;   // drawdown_threshold 에서의 축소 비율
    double drawdown_threshold = 0.15;
    double max_var_pct = 0.02;
    double max_cvar_pct = 0.03;
    double var_confidence = 0.95;
    double target_volatility = 0.02;    // daily
    size_t rolling_window = 50;
    double exp_half_life = 20.0;        // trades
};

} // namespace risk
} // namespace quantcore
