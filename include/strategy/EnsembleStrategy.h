#pragma once

#include "strategy/IStrategy.h"
#include "strategy/StrategyConfig.h"
#include "strategy/MomentumStrategy.h"
#include "strategy/MeanReversionStrategy.h"
#include "analytics/RegimeDetector.h"

namespace quantcore {
namespace strategy {

// 국면별 가중치로 모멘텀 / 평균회귀 신호를 혼합
class EnsembleStrategy : public IStrategy {
public:
    struct Weights {
        double momentum;
        double mean_reversion;
    };

    explicit EnsembleStrategy(EnsembleConfig config = EnsembleConfig(),
                              MomentumConfig momentum_config = MomentumConfig(),
                              MeanReversionConfig mean_reversion_config = MeanReversionConfig());

    std::string getName() const override { return "ensemble"; }

    Signal generateSignal(const std::vector<double>& closes,
                          const std::vector<Candle>* candles = nullptr) const override;

    Weights regimeWeights(analytics::MarketRegime regime) const;

private:
    EnsembleConfig config_;
    MomentumStrategy momentum_;
    MeanReversionStrategy mean_reversion_;
    analytics::RegimeDetector regime_detector_;
};

} // namespace strategy
} // namespace quantcore
