#pragma once

#include "strategy/IStrategy.h"
#include "strategy/StrategyConfig.h"

namespace quantcore {
namespace strategy {

// 단일 자산 평균회귀 (z-score + Bollinger %B, Hurst 게이트)
class MeanReversionStrategy : public IStrategy {
public:
    explicit MeanReversionStrategy(MeanReversionConfig config = MeanReversionConfig());

    std::string getName() const override { return "mean_reversion"; }

    Signal generateSignal(const std::vector<double>& closes,
                          const std::vector<Candle>* candles = nullptr) const override;

    // Linear between entry and stop (capped at 0.95); below entry, |z|/entry * 0.3
    static double thresholdConfidence(double abs_z, double entry_z, double stop_z);

    // Hurst < 0.5 -> 1.0, [0.5, 0.6) -> 0.5, otherwise 0 (reject)
    static double hurstPenalty(const std::optional<double>& hurst);

    const MeanReversionConfig& config() const { return config_; }

private:
    MeanReversionConfig config_;
};

} // namespace strategy
} // namespace quantcore
