#include "strategy/PairsTradingStrategy.h"
#include "strategy/MeanReversionStrategy.h"
#include "analytics/KalmanHedgeRatio.h"
#include "common/Logger.h"
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace quantcore {
namespace strategy {

using analytics::Statistics;

namespace {

std::vector<double> lastN(const std::vector<double>& values, size_t count) {
    return std::vector<double>(values.end() - static_cast<std::ptrdiff_t>(count), values.end());
}

} // namespace

PairsTradingStrategy::PairsTradingStrategy(PairsTradingConfig config)
    : config_(config) {
    if (config_.hedge_ratio_lookback < 3 || config_.z_score_period < 2 ||
        config_.min_data_points < config_.z_score_period) {
        throw std::invalid_argument("PairsTradingStrategy: invalid window configuration");
    }
    if (config_.exit_z_score < 0.0 || config_.entry_z_score <= config_.exit_z_score ||
        config_.stop_z_score <= config_.entry_z_score) {
        throw std::invalid_argument("PairsTradingStrategy: thresholds must satisfy 0 <= exit < entry < stop");
    }
    // analyze() 는 use_kalman 과 무관하게 Kalman beta 를 보고한다
    if (!(config_.kalman_delta > 0.0) || !(config_.kalman_ve > 0.0) || !(config_.kalman_initial_p > 0.0)) {
        throw std::invalid_argument("PairsTradingStrategy: Kalman noise parameters must be positive");
    }
}

std::optional<double> PairsTradingStrategy::kalmanBeta(const std::vector<double>& closes_a,
                                                       const std::vector<double>& closes_b) const {
    if (closes_a.empty() || closes_b.empty()) {
        return std::nullopt;
    }
    // 호출마다 새 필터: 동일 입력 -> 동일 결과
    analytics::KalmanHedgeRatio kalman(config_.kalman_delta, config_.kalman_ve, config_.kalman_initial_p);
    const auto betas = kalman.filter(closes_a, closes_b);
    if (betas.empty() || !std::isfinite(betas.back())) {
        return std::nullopt;
    }
    return betas.back();
}

std::optional<SpreadSeries> PairsTradingStrategy::computeSpread(const std::vector<double>& closes_a,
                                                                const std::vector<double>& closes_b) const {
    const size_t n = std::min(closes_a.size(), closes_b.size());
    if (n < config_.min_data_points) {
        return std::nullopt;
    }

    const auto a = lastN(closes_a, n);
    const auto b = lastN(closes_b, n);
    const size_t lookback = std::min(config_.hedge_ratio_lookback, n);
    const auto window_a = lastN(a, lookback);
    const auto window_b = lastN(b, lookback);

    SpreadSeries spread;
    if (config_.use_kalman) {
        const auto beta = kalmanBeta(a, b);
        if (!beta) {
            return std::nullopt;
        }
        spread.hedge_ratio = *beta;
        spread.intercept = 0.0;

        const double mean_a = Statistics::mean(window_a);
        double ss_res = 0.0, ss_tot = 0.0;
        for (size_t i = 0; i < lookback; ++i) {
            const double r = window_a[i] - spread.hedge_ratio * window_b[i];
            ss_res += r * r;
            ss_tot += (window_a[i] - mean_a) * (window_a[i] - mean_a);
        }
        spread.r_squared = ss_tot > Statistics::kEpsilon ? 1.0 - ss_res / ss_tot : 0.0;
    } else {
        // 최근 lookback 구간으로 hedge ratio 추정 (look-ahead 없음)
        const auto fit = Statistics::ols(window_a, window_b);
        if (!fit) {
            return std::nullopt;
        }
        spread.hedge_ratio = fit->beta;
        spread.intercept = fit->alpha;
        spread.r_squared = fit->r_squared;
    }

    // 전체 구간에 적용
    spread.values.reserve(n);
    for (size_t i = 0; i < n; ++i) {
        spread.values.push_back(a[i] - spread.hedge_ratio * b[i] - spread.intercept);
    }
    return spread;
}

CointegrationResult PairsTradingStrategy::evaluateCointegration(const SpreadSeries& spread,
                                                                const std::vector<double>& closes_a,
                                                                const std::vector<double>& closes_b) const {
    CointegrationResult result;

    if (auto adf = Statistics::adfTest(spread.values)) {
        result.adf_statistic = adf->statistic;
        result.adf_p_value = adf->p_value;
        result.is_stationary = adf->is_stationary;
    }
    result.hurst_exponent = Statistics::hurstExponent(Statistics::differences(spread.values),
                                                      config_.hurst_max_lag);
    result.half_life_bars = Statistics::halfLife(spread.values);

    const auto johansen = Statistics::johansenTest(closes_a, closes_b);
    result.johansen_rank = johansen.rank;
    result.johansen_reason = johansen.reason;

    result.is_cointegrated = result.is_stationary || result.johansen_rank >= 1;
    return result;
}

PairAnalysis PairsTradingStrategy::analyze(const std::vector<double>& closes_a,
                                           const std::vector<double>& closes_b) const {
    PairAnalysis analysis;
    const size_t n = std::min(closes_a.size(), closes_b.size());
    if (n < config_.min_data_points) {
        analysis.signal = Signal::hold(fmt::format("Insufficient data: need {}, got {}",
                                                   config_.min_data_points, n));
        return analysis;
    }

    analysis.kalman_beta = kalmanBeta(closes_a, closes_b);
    analysis.spread = computeSpread(closes_a, closes_b);
    if (!analysis.spread) {
        analysis.signal = Signal::hold("Hedge ratio regression failed (degenerate input)");
        return analysis;
    }

    const SpreadSeries& spread = *analysis.spread;
    analysis.cointegration = evaluateCointegration(spread, closes_a, closes_b);
    const CointegrationResult& coint = *analysis.cointegration;

    Signal& signal = analysis.signal;
    signal.hedge_ratio = spread.hedge_ratio;

    // 1. ADF 게이트
    if (!coint.is_stationary) {
        signal.reasons.push_back(coint.adf_statistic
            ? fmt::format("Spread not stationary (ADF {:.2f}, p={:.2f})", *coint.adf_statistic, *coint.adf_p_value)
            : std::string("Spread not stationary (ADF unavailable)"));
        return analysis;
    }
    signal.reasons.push_back(fmt::format("Spread stationary (ADF {:.2f}, p={:.2f})",
                                         *coint.adf_statistic, *coint.adf_p_value));

    // 2. Hurst 게이트
    const double penalty = MeanReversionStrategy::hurstPenalty(coint.hurst_exponent);
    if (penalty <= 0.0) {
        signal.reasons.push_back(coint.hurst_exponent
            ? fmt::format("Hurst {:.2f} >= 0.6, spread trending", *coint.hurst_exponent)
            : std::string("Hurst unavailable"));
        return analysis;
    }
    signal.reasons.push_back(fmt::format("Hurst {:.2f} ({})", *coint.hurst_exponent,
                                         penalty < 1.0 ? "borderline, 50% penalty" : "mean-reverting"));

    // 3. (선택) Johansen 게이트
    if (config_.require_johansen && coint.johansen_rank < 1) {
        signal.reasons.push_back(coint.johansen_reason.empty()
            ? std::string("Johansen rank 0")
            : "Johansen rank 0: " + coint.johansen_reason);
        return analysis;
    }

    const auto z = Statistics::zScore(spread.values, config_.z_score_period);
    if (!z) {
        signal.reasons.push_back("Z-score unavailable");
        return analysis;
    }
    signal.z_score = z;
    const double abs_z = std::abs(*z);

    // 4. Stop: 공적분 붕괴로 간주
    if (abs_z >= config_.stop_z_score) {
        signal.reasons.push_back(fmt::format("Z-score {:.2f} beyond stop {:.2f}, flat",
                                             *z, config_.stop_z_score));
        return analysis;
    }

    // 5. 진입 / 청산
    if (*z <= -config_.entry_z_score) {
        signal.strength = 1.0;
        signal.action = SignalAction::BUY;
        signal.reasons.push_back(fmt::format("Z-score {:.2f} <= -{:.2f}, long spread (buy A, sell B)",
                                             *z, config_.entry_z_score));
    } else if (*z >= config_.entry_z_score) {
        signal.strength = -1.0;
        signal.action = SignalAction::SELL;
        signal.reasons.push_back(fmt::format("Z-score {:.2f} >= {:.2f}, short spread (sell A, buy B)",
                                             *z, config_.entry_z_score));
    } else if (abs_z <= config_.exit_z_score) {
        signal.reasons.push_back(fmt::format("Z-score {:.2f} near mean, exit", *z));
    } else {
        signal.reasons.push_back(fmt::format("Z-score {:.2f} in no-trade zone", *z));
    }

    signal.confidence = MeanReversionStrategy::thresholdConfidence(abs_z, config_.entry_z_score,
                                                                   config_.stop_z_score) * penalty;
    return analysis;
}

Signal PairsTradingStrategy::generateSignal(const std::vector<double>& closes_a,
                                            const std::vector<double>& closes_b) const {
    return analyze(closes_a, closes_b).signal;
}

PositionLegs PairsTradingStrategy::getPositionLegs(double notional, double price_a, double price_b,
                                                   double hedge_ratio) {
    PositionLegs legs;
    legs.hedge_ratio = std::abs(hedge_ratio);
    const double unit_cost = price_a + legs.hedge_ratio * price_b;
    if (notional <= 0.0 || unit_cost <= 0.0) {
        return legs;
    }
    legs.quantity_a = notional / unit_cost;
    legs.quantity_b = legs.quantity_a * legs.hedge_ratio;
    return legs;
}

} // namespace strategy
} // namespace quantcore
