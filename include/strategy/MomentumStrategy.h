#pragma once

#include "strategy/IStrategy.h"
#include "strategy/StrategyConfig.h"

namespace quantcore {
namespace strategy {

// 시계열 모멘텀 + 변동성 타겟팅
class MomentumStrategy : public IStrategy {
public:
    explicit MomentumStrategy(MomentumConfig config = MomentumConfig());

    std::string getName() const override { return "momentum"; }

    Signal generateSignal(const std::vector<double>& closes,
                          const std::vector<Candle>* candles = nullptr) const override;

    const MomentumConfig& config() const { return config_; }

private:
    MomentumConfig config_;
};

} // namespace strategy
} // namespace quantcore
