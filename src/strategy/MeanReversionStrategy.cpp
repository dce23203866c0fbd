#include "strategy/MeanReversionStrategy.h"
#include "analytics/Statistics.h"
#include "analytics/TechnicalIndicators.h"
#include "common/Logger.h"
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace quantcore {
namespace strategy {

using analytics::Statistics;

MeanReversionStrategy::MeanReversionStrategy(MeanReversionConfig config)
    : config_(config) {
    if (config_.z_score_period < 2 || config_.bollinger_period < 2 ||
        config_.exit_z_score < 0.0 || config_.entry_z_score <= config_.exit_z_score ||
        config_.stop_z_score <= config_.entry_z_score) {
        throw std::invalid_argument("MeanReversionStrategy: thresholds must satisfy 0 <= exit < entry < stop");
    }
}

double MeanReversionStrategy::thresholdConfidence(double abs_z, double entry_z, double stop_z) {
    if (abs_z >= entry_z) {
        return std::min((abs_z - entry_z) / (stop_z - entry_z), 0.95);
    }
    return abs_z / entry_z * 0.3;
}

double MeanReversionStrategy::hurstPenalty(const std::optional<double>& hurst) {
    if (!hurst) return 0.0;
    if (*hurst < 0.5) return 1.0;
    if (*hurst < 0.6) return 0.5;
    return 0.0;
}

Signal MeanReversionStrategy::generateSignal(const std::vector<double>& closes,
                                             const std::vector<Candle>* candles) const {
    (void)candles;
    const size_t required = std::max(config_.z_score_period,
                                     static_cast<size_t>(config_.bollinger_period)) + 10;
    if (closes.size() < required) {
        return Signal::hold("Insufficient data");
    }

    const auto z = Statistics::zScore(closes, config_.z_score_period);
    const auto bands = analytics::TechnicalIndicators::calculateBollingerBands(
        closes, closes.back(), config_.bollinger_period, config_.bollinger_std_dev);
    const auto hurst = Statistics::hurstExponent(Statistics::logReturns(closes), config_.hurst_max_lag);

    const double penalty = hurstPenalty(hurst);
    if (penalty <= 0.0) {
        Signal s = Signal::hold(hurst
            ? fmt::format("Hurst {:.2f} >= 0.6, trending, skip mean reversion", *hurst)
            : std::string("Hurst unavailable, skip mean reversion"));
        s.z_score = z;
        return s;
    }
    if (!z) {
        return Signal::hold("Z-score unavailable");
    }

    Signal signal;
    signal.z_score = z;
    const double abs_z = std::abs(*z);

    if (*z <= -config_.entry_z_score) {
        signal.strength = 1.0;
        signal.reasons.push_back(fmt::format("Z-score {:.2f} <= -{:.2f}, oversold", *z, config_.entry_z_score));
    } else if (*z >= config_.entry_z_score) {
        signal.strength = -1.0;
        signal.reasons.push_back(fmt::format("Z-score {:.2f} >= {:.2f}, overbought", *z, config_.entry_z_score));
    } else if (abs_z <= config_.exit_z_score) {
        signal.reasons.push_back(fmt::format("Z-score {:.2f} near mean, exit", *z));
    } else {
        signal.reasons.push_back(fmt::format("Z-score {:.2f} in no-trade zone", *z));
    }

    const bool stopped = abs_z >= config_.stop_z_score;
    if (stopped) {
        signal.strength = 0.0;
        signal.reasons.push_back(fmt::format("Z-score {:.2f} hit stop at {:.2f}", *z, config_.stop_z_score));
    }

    if (bands) {
        if (bands->percent_b < 0.0 && signal.strength > 0.0) signal.reasons.push_back("Confirmed: below lower band");
        if (bands->percent_b > 1.0 && signal.strength < 0.0) signal.reasons.push_back("Confirmed: above upper band");
    }

    signal.confidence = stopped
        ? 0.0
        : thresholdConfidence(abs_z, config_.entry_z_score, config_.stop_z_score) * penalty;
    signal.action = signal.strength > 0.0 ? SignalAction::BUY
                  : (signal.strength < 0.0 ? SignalAction::SELL : SignalAction::HOLD);
    signal.reasons.push_back(fmt::format("Hurst: {:.2f} ({})", *hurst,
                                         penalty < 1.0 ? "borderline, 50% penalty" : "mean-reverting"));
    return signal;
}

} // namespace strategy
} // namespace quantcore
