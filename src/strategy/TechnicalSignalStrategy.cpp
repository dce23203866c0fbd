#include "strategy/TechnicalSignalStrategy.h"
#include "analytics/TechnicalIndicators.h"
#include "common/Logger.h"
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace quantcore {
namespace strategy {

using analytics::TechnicalIndicators;

TechnicalSignalStrategy::TechnicalSignalStrategy(TechnicalSignalConfig config)
    : config_(config) {
    if (config_.rsi_period <= 0 || config_.macd_fast <= 0 || config_.macd_slow <= config_.macd_fast ||
        config_.macd_signal <= 0 || config_.bollinger_period < 2) {
        throw std::invalid_argument("TechnicalSignalStrategy: invalid indicator periods");
    }
}

int TechnicalSignalStrategy::score(const std::vector<double>& closes,
                                   const std::vector<Candle>* candles,
                                   std::vector<std::string>& reasons) const {
    int total = 0;
    const double price = closes.back();

    // 1. RSI
    if (auto rsi = TechnicalIndicators::calculateRSI(closes, config_.rsi_period)) {
        if (*rsi < 30.0) { total += 2; reasons.push_back(fmt::format("RSI oversold ({:.1f})", *rsi)); }
        else if (*rsi < 40.0) { total += 1; reasons.push_back(fmt::format("RSI low ({:.1f})", *rsi)); }
        else if (*rsi > 70.0) { total -= 2; reasons.push_back(fmt::format("RSI overbought ({:.1f})", *rsi)); }
        else if (*rsi > 60.0) { total -= 1; reasons.push_back(fmt::format("RSI high ({:.1f})", *rsi)); }
    }

    // 2. MACD
    if (auto macd = TechnicalIndicators::calculateMACD(closes, config_.macd_fast,
                                                        config_.macd_slow, config_.macd_signal)) {
        if (macd->histogram > 0 && macd->macd > macd->signal) {
            total += 1; reasons.push_back("MACD bullish crossover");
        } else if (macd->histogram < 0 && macd->macd < macd->signal) {
            total -= 1; reasons.push_back("MACD bearish crossover");
        }
    }

    // 3. Bollinger (평균회귀 관점)
    if (auto bands = TechnicalIndicators::calculateBollingerBands(closes, price, config_.bollinger_period,
                                                                  config_.bollinger_std_dev)) {
        if (price < bands->lower) {
            total += 2; reasons.push_back("Price below lower Bollinger Band");
        } else if (price > bands->upper) {
            total -= 2; reasons.push_back("Price above upper Bollinger Band");
        }
        if (bands->width > 0.0) {
            if (bands->percent_b < 0.2) {
                total += 1; reasons.push_back("Price near lower Bollinger Band");
            } else if (bands->percent_b > 0.8) {
                total -= 1; reasons.push_back("Price near upper Bollinger Band");
            }
        }
    }

    // 4. 거래량 급증은 기존 방향을 증폭
    if (candles && !candles->empty()) {
        const auto volumes = TechnicalIndicators::extractVolumes(*candles);
        if (TechnicalIndicators::detectVolumeSpike(volumes, config_.volume_spike_threshold)) {
            total = total > 0 ? total + 1 : (total < 0 ? total - 1 : total);
            reasons.push_back("Volume spike detected");
        }
    }

    return total;
}

Signal TechnicalSignalStrategy::generateSignal(const std::vector<double>& closes,
                                               const std::vector<Candle>* candles) const {
    if (closes.empty()) {
        return Signal::hold("No price data");
    }

    Signal signal;
    const int total = score(closes, candles, signal.reasons);
    signal.strength = std::clamp(static_cast<double>(total) / kMaxScore, -1.0, 1.0);
    signal.confidence = std::min(std::abs(static_cast<double>(total)) / kMaxScore, 1.0);
    signal.action = total >= 2 ? SignalAction::BUY
                  : (total <= -2 ? SignalAction::SELL : SignalAction::HOLD);
    return signal;
}

} // namespace strategy
} // namespace quantcore
