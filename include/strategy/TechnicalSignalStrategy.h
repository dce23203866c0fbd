#pragma once

#include "strategy/IStrategy.h"
#include "strategy/StrategyConfig.h"

namespace quantcore {
namespace strategy {

// RSI / MACD / Bollinger / 거래량 급증 점수 합산 전략
// score >= 2 -> BUY, <= -2 -> SELL, confidence = |score| / 10
class TechnicalSignalStrategy : public IStrategy {
public:
    static constexpr int kMaxScore = 10;

    explicit TechnicalSignalStrategy(TechnicalSignalConfig config = TechnicalSignalConfig());

    std::string getName() const override { return "technical"; }

    Signal generateSignal(const std::vector<double>& closes,
                          const std::vector<Candle>* candles = nullptr) const override;

    int score(const std::vector<double>& closes,
              const std::vector<Candle>* candles,
              std::vector<std::string>& reasons) const;

private:
    TechnicalSignalConfig config_;
};

} // namespace strategy
} // namespace quantcore
