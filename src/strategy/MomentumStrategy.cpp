#include "strategy/MomentumStrategy.h"
#include "analytics/Statistics.h"
#include "common/Logger.h"
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace quantcore {
namespace strategy {

MomentumStrategy::MomentumStrategy(MomentumConfig config)
    : config_(config) {
    if (config_.lookback == 0 || config_.vol_window < 2 || !(config_.target_risk > 0.0) ||
        config_.entry_threshold < 0.0) {
        throw std::invalid_argument("MomentumStrategy: invalid configuration");
    }
}

Signal MomentumStrategy::generateSignal(const std::vector<double>& closes,
                                        const std::vector<Candle>* candles) const {
    (void)candles;
    if (closes.size() < config_.lookback + config_.vol_window) {
        return Signal::hold("Insufficient data");
    }

    const double current = closes.back();
    const double past = closes[closes.size() - 1 - config_.lookback];
    if (past <= 0.0) {
        return Signal::hold("Non-positive reference price");
    }
    const double momentum = (current - past) / past;

    // 최근 vol_window 개 수익률의 변동성
    std::vector<double> window(closes.end() - static_cast<std::ptrdiff_t>(config_.vol_window + 1),
                               closes.end());
    const double volatility = analytics::Statistics::stdDev(analytics::Statistics::simpleReturns(window));

    const double vol_scale = volatility > analytics::Statistics::kEpsilon
        ? std::min(config_.target_risk / volatility, 2.0)
        : 1.0;
    const int raw = momentum > config_.entry_threshold ? 1
                  : (momentum < -config_.entry_threshold ? -1 : 0);
    const double scaled = raw * vol_scale;

    const double momentum_z = volatility > analytics::Statistics::kEpsilon
        ? std::abs(momentum) / volatility
        : 0.0;

    Signal signal;
    signal.strength = std::clamp(scaled, -1.0, 1.0);
    signal.confidence = std::min(momentum_z / 3.0, 1.0);
    signal.action = scaled > 0.1 ? SignalAction::BUY
                  : (scaled < -0.1 ? SignalAction::SELL : SignalAction::HOLD);
    signal.reasons.push_back(fmt::format("{} {}-bar momentum: {:.2f}%",
                                         momentum > 0 ? "Positive" : "Negative",
                                         config_.lookback, momentum * 100.0));
    signal.reasons.push_back(fmt::format("Volatility: {:.2f}%, scale: {:.2f}",
                                         volatility * 100.0, vol_scale));
    return signal;
}

} // namespace strategy
} // namespace quantcore
