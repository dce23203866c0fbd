#pragma once

#include "strategy/IStrategy.h"
#include "strategy/StrategyConfig.h"
#include "analytics/Statistics.h"
#include <optional>
#include <vector>

namespace quantcore {
namespace strategy {

// spread[i] = A[i] - hedge_ratio * B[i] - intercept
struct SpreadSeries {
    std::vector<double> values;
    double hedge_ratio = 0.0;
    double intercept = 0.0;
    double r_squared = 0.0;
};

// 평가마다 새로 생성, 수정하지 않는다
struct CointegrationResult {
    std::optional<double> adf_statistic;
    std::optional<double> adf_p_value;
    bool is_stationary = false;
    std::optional<double> hurst_exponent;
    std::optional<double> half_life_bars;   // empty when not mean-reverting
    int johansen_rank = 0;
    std::string johansen_reason;
    bool is_cointegrated = false;           // ADF rejects unit root or Johansen rank >= 1
};

struct PositionLegs {
    double quantity_a = 0.0;
    double quantity_b = 0.0;
    double hedge_ratio = 0.0;   // absolute value used for sizing
};

struct PairAnalysis {
    Signal signal;
    std::optional<SpreadSeries> spread;
    std::optional<CointegrationResult> cointegration;
    std::optional<double> kalman_beta;
};

// 공적분 페어 스프레드 평균회귀 전략
// 단계: ADF 게이트 -> Hurst 게이트 -> (선택) Johansen 게이트 -> z-score 상태기계
class PairsTradingStrategy : public IPairStrategy {
public:
    explicit PairsTradingStrategy(PairsTradingConfig config = PairsTradingConfig());

    std::string getName() const override { return "pairs_trading"; }

    Signal generateSignal(const std::vector<double>& closes_a,
                          const std::vector<double>& closes_b) const override;

    PairAnalysis analyze(const std::vector<double>& closes_a,
                         const std::vector<double>& closes_b) const;

    // Hedge ratio from the trailing window, applied to the whole common-length series
    std::optional<SpreadSeries> computeSpread(const std::vector<double>& closes_a,
                                              const std::vector<double>& closes_b) const;

    CointegrationResult evaluateCointegration(const SpreadSeries& spread,
                                              const std::vector<double>& closes_a,
                                              const std::vector<double>& closes_b) const;

    // qty_a * price_a + qty_b * price_b = notional, qty_b = qty_a * |hedge|
    static PositionLegs getPositionLegs(double notional, double price_a, double price_b,
                                        double hedge_ratio);

    const PairsTradingConfig& config() const { return config_; }

private:
    std::optional<double> kalmanBeta(const std::vector<double>& closes_a,
                                     const std::vector<double>& closes_b) const;

    PairsTradingConfig config_;
};

} // namespace strategy
} // namespace quantcore
