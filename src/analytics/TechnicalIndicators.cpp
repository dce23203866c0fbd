#include "analytics/TechnicalIndicators.h"
#include "analytics/Statistics.h"
#include <cmath>
#include <algorithm>

namespace quantcore {
namespace analytics {

// RSI 계산 (Wilder's Smoothing 방식)
std::optional<double> TechnicalIndicators::calculateRSI(const std::vector<double>& prices, int period) {
    if (period <= 0 || prices.size() < static_cast<size_t>(period + 1)) {
        return std::nullopt;
    }
    
    double avg_gain = 0.0;
    double avg_loss = 0.0;
    
    // 1. 초기 RSI 계산 (첫 period 기간)
    for (int i = 1; i <= period; ++i) {
        double change = prices[i] - prices[i-1];
        if (change > 0) avg_gain += change;
        else avg_loss += std::abs(change);
    }
    
    avg_gain /= period;
    avg_loss /= period;
    
    // 2. Wilder's Smoothing 적용 (끝까지 순회)
    for (size_t i = period + 1; i < prices.size(); ++i) {
        double change = prices[i] - prices[i-1];
        double current_gain = (change > 0) ? change : 0.0;
        double current_loss = (change < 0) ? std::abs(change) : 0.0;
        
        avg_gain = ((avg_gain * (period - 1)) + current_gain) / period;
        avg_loss = ((avg_loss * (period - 1)) + current_loss) / period;
    }
    
    if (avg_loss < 0.0000001) return 100.0;
    
    double rs = avg_gain / avg_loss;
    return 100.0 - (100.0 / (1.0 + rs));
}

std::optional<TechnicalIndicators::MACDResult> TechnicalIndicators::calculateMACD(
    const std::vector<double>& prices,
    int fast,
    int slow,
    int signal_period
) {
    if (fast <= 0 || slow <= fast || signal_period <= 0 ||
        prices.size() < static_cast<size_t>(slow + signal_period)) {
        return std::nullopt;
    }
    
    auto fast_ema_vec = calculateEMAVector(prices, fast);
    auto slow_ema_vec = calculateEMAVector(prices, slow);
    if (fast_ema_vec.empty() || slow_ema_vec.empty()) return std::nullopt;
    
    // 두 EMA 벡터를 최신 시점 기준으로 맞춰 MACD 시계열 생성
    std::vector<double> macd_series;
    size_t min_size = std::min(fast_ema_vec.size(), slow_ema_vec.size());
    size_t offset_fast = fast_ema_vec.size() - min_size;
    size_t offset_slow = slow_ema_vec.size() - min_size;
    macd_series.reserve(min_size);
    for (size_t i = 0; i < min_size; ++i) {
        macd_series.push_back(fast_ema_vec[offset_fast + i] - slow_ema_vec[offset_slow + i]);
    }
    
    MACDResult result;
    result.macd = macd_series.back();
    result.signal = calculateEMA(macd_series, signal_period);
    result.histogram = result.macd - result.signal;
    return result;
}

std::optional<TechnicalIndicators::BollingerBands> TechnicalIndicators::calculateBollingerBands(
    const std::vector<double>& prices,
    double current_price,
    int period,
    double std_dev_mult
) {
    if (period <= 0 || prices.size() < static_cast<size_t>(period)) {
        return std::nullopt;
    }
    
    std::vector<double> recent_prices(prices.end() - period, prices.end());
    
    BollingerBands result;
    result.middle = calculateSMA(prices, period);
    double std_dev = Statistics::stdDev(recent_prices);
    
    result.upper = result.middle + (std_dev * std_dev_mult);
    result.lower = result.middle - (std_dev * std_dev_mult);
    result.width = result.upper - result.lower;
    
    if (result.width > Statistics::kEpsilon) {
        result.percent_b = (current_price - result.lower) / result.width;
    } else {
        result.percent_b = 0.5;
    }
    
    return result;
}

double TechnicalIndicators::calculateEMA(const std::vector<double>& prices, int period) {
    if (prices.empty() || period <= 0) return 0.0;
    if (prices.size() < static_cast<size_t>(period)) return prices.back();
    
    auto values = calculateEMAVector(prices, period);
    return values.back();
}

std::vector<double> TechnicalIndicators::calculateEMAVector(
    const std::vector<double>& prices,
    int period
) {
    std::vector<double> ema_values;
    if (period <= 0 || prices.size() < static_cast<size_t>(period)) return ema_values;
    
    double multiplier = 2.0 / (period + 1.0);
    
    // 초기 SMA
    double ema = 0.0;
    for (int i = 0; i < period; ++i) ema += prices[i];
    ema /= period;
    
    ema_values.reserve(prices.size() - period + 1);
    ema_values.push_back(ema);
    
    for (size_t i = period; i < prices.size(); ++i) {
        ema = (prices[i] - ema) * multiplier + ema;
        ema_values.push_back(ema);
    }
    
    return ema_values;
}

double TechnicalIndicators::calculateSMA(const std::vector<double>& prices, int period) {
    if (period <= 0 || prices.size() < static_cast<size_t>(period)) return 0.0;
    
    double sum = 0.0;
    for (size_t i = prices.size() - period; i < prices.size(); ++i) {
        sum += prices[i];
    }
    return sum / period;
}

bool TechnicalIndicators::detectVolumeSpike(const std::vector<double>& volumes, double threshold) {
    if (volumes.size() < 21) return false;
    
    // 직전 19개 (현재 봉 제외)
    double sum = 0.0;
    for (size_t i = volumes.size() - 20; i + 1 < volumes.size(); ++i) {
        sum += volumes[i];
    }
    const double avg_volume = sum / 19.0;
    return avg_volume > 0.0 && volumes.back() > avg_volume * threshold;
}

std::vector<double> TechnicalIndicators::extractClosePrices(const std::vector<Candle>& candles) {
    std::vector<double> prices;
    prices.reserve(candles.size());
    for (const auto& candle : candles) {
        prices.push_back(candle.close);
    }
    return prices;
}

std::vector<double> TechnicalIndicators::extractVolumes(const std::vector<Candle>& candles) {
    std::vector<double> volumes;
    volumes.reserve(candles.size());
    for (const auto& candle : candles) {
        volumes.push_back(candle.volume);
    }
    return volumes;
}

} // namespace analytics
} // namespace quantcore
