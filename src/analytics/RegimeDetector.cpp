#include "analytics/RegimeDetector.h"
#include "analytics/Statistics.h"
#include <cmath>

namespace quantcore {
namespace analytics {

const char* toString(MarketRegime regime) {
    switch (regime) {
        case MarketRegime::HIGH_VOL_TRENDING: return "high_vol_trending";
        case MarketRegime::LOW_VOL_RANGE: return "low_vol_range";
        case MarketRegime::TRENDING: return "trending";
        case MarketRegime::RANGE_BOUND: return "range_bound";
        default: return "unknown";
    }
}

const char* toString(SizingRegime regime) {
    switch (regime) {
        case SizingRegime::BULL_LOW_VOL: return "bull_low_vol";
        case SizingRegime::BEAR_HIGH_VOL: return "bear_high_vol";
        case SizingRegime::RANGE_BOUND: return "range_bound";
        default: return "uncertain";
    }
}

RegimeAnalysis RegimeDetector::analyzeRegime(const std::vector<double>& closes) const {
    RegimeAnalysis result;
    
    if (closes.size() < kMinBars) {
        result.description = "Insufficient Data";
        return result;
    }

    // 1. 최근 20봉 / 60봉 수익률 변동성
    std::vector<double> window_20(closes.end() - 21, closes.end());
    std::vector<double> window_60(closes.end() - 61, closes.end());
    result.recent_volatility = Statistics::stdDev(Statistics::simpleReturns(window_20));
    result.long_volatility = Statistics::stdDev(Statistics::simpleReturns(window_60));
    result.volatility_ratio = result.recent_volatility /
        (result.long_volatility > Statistics::kEpsilon ? result.long_volatility : 1.0);

    // 2. 30봉 수익률
    const double base = closes[closes.size() - 31];
    result.return_30 = base != 0.0 ? (closes.back() - base) / base : 0.0;
    const double abs_ret = std::abs(result.return_30);

    // 3. Regime Classification
    if (result.volatility_ratio > 1.5 && abs_ret > 0.15) {
        result.regime = MarketRegime::HIGH_VOL_TRENDING;
        result.description = "High Volatility Trend";
    } else if (result.volatility_ratio < 0.8 && abs_ret < 0.05) {
        result.regime = MarketRegime::LOW_VOL_RANGE;
        result.description = "Low Volatility Range";
    } else if (abs_ret > 0.10) {
        result.regime = MarketRegime::TRENDING;
        result.description = "Trending";
    } else {
        result.regime = MarketRegime::RANGE_BOUND;
        result.description = "Range Bound";
    }

    result.sizing_regime = classifySizing(result.volatility_ratio, result.return_30);
    return result;
}

SizingRegime RegimeDetector::classifySizing(double volatility_ratio, double return_30) {
    if (return_30 > 0.05 && volatility_ratio <= 1.2) {
        return SizingRegime::BULL_LOW_VOL;
    }
    if (return_30 < -0.05 && volatility_ratio > 1.2) {
        return SizingRegime::BEAR_HIGH_VOL;
    }
    if (std::abs(return_30) <= 0.05) {
        return SizingRegime::RANGE_BOUND;
    }
    return SizingRegime::UNCERTAIN;
}

} // namespace analytics
} // namespace quantcore
