#include "strategy/EnsembleStrategy.h"
#include "common/Logger.h"
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace quantcore {
namespace strategy {

EnsembleStrategy::EnsembleStrategy(EnsembleConfig config,
                                   MomentumConfig momentum_config,
                                   MeanReversionConfig mean_reversion_config)
    : config_(config)
    , momentum_(momentum_config)
    , mean_reversion_(mean_reversion_config) {
    if (config_.default_momentum_weight < 0.0 || config_.default_mean_reversion_weight < 0.0 ||
        config_.default_momentum_weight + config_.default_mean_reversion_weight <= 0.0 ||
        config_.action_threshold < 0.0) {
        throw std::invalid_argument("EnsembleStrategy: invalid weights");
    }
}

EnsembleStrategy::Weights EnsembleStrategy::regimeWeights(analytics::MarketRegime regime) const {
    switch (regime) {
        case analytics::MarketRegime::TRENDING:
        case analytics::MarketRegime::HIGH_VOL_TRENDING:
            return {0.7, 0.3};
        case analytics::MarketRegime::RANGE_BOUND:
        case analytics::MarketRegime::LOW_VOL_RANGE:
            return {0.3, 0.7};
        default:
            return {config_.default_momentum_weight, config_.default_mean_reversion_weight};
    }
}

Signal EnsembleStrategy::generateSignal(const std::vector<double>& closes,
                                        const std::vector<Candle>* candles) const {
    const Signal mom = momentum_.generateSignal(closes, candles);
    const Signal mr = mean_reversion_.generateSignal(closes, candles);
    const auto regime = regime_detector_.analyzeRegime(closes);
    const Weights w = regimeWeights(regime.regime);

    const double combined = w.momentum * mom.strength + w.mean_reversion * mr.strength;
    const double confidence = w.momentum * mom.confidence + w.mean_reversion * mr.confidence;

    Signal signal;
    signal.strength = std::clamp(combined, -1.0, 1.0);
    signal.confidence = std::clamp(confidence, 0.0, 1.0);
    signal.z_score = mr.z_score;
    signal.action = combined > config_.action_threshold ? SignalAction::BUY
                  : (combined < -config_.action_threshold ? SignalAction::SELL : SignalAction::HOLD);
    signal.reasons.push_back(fmt::format("Regime: {} (mom: {:.0f}%, mr: {:.0f}%)",
                                         analytics::toString(regime.regime),
                                         w.momentum * 100.0, w.mean_reversion * 100.0));
    signal.reasons.push_back(fmt::format("Momentum: {} ({:.2f})", toString(mom.action), mom.confidence));
    signal.reasons.push_back(fmt::format("MeanRev: {} ({:.2f})", toString(mr.action), mr.confidence));
    signal.reasons.push_back(fmt::format("Combined: {:.3f}", combined));
    return signal;
}

} // namespace strategy
} // namespace quantcore
