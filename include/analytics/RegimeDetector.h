#pragma once

#include <vector>
#include <string>

namespace quantcore {
namespace analytics {

// 앙상블 가중치용 변동성/추세 국면
enum class MarketRegime {
    UNKNOWN,
    HIGH_VOL_TRENDING,  // vol ratio > 1.5, |30-bar return| > 15%
    LOW_VOL_RANGE,      // vol ratio < 0.8, |30-bar return| < 5%
    TRENDING,           // |30-bar return| > 10%
    RANGE_BOUND
};

// Kelly fraction 선택용 국면
enum class SizingRegime {
    BULL_LOW_VOL,
    BEAR_HIGH_VOL,
    RANGE_BOUND,
    UNCERTAIN
};

const char* toString(MarketRegime regime);
const char* toString(SizingRegime regime);

struct RegimeAnalysis {
    MarketRegime regime = MarketRegime::UNKNOWN;
    SizingRegime sizing_regime = SizingRegime::UNCERTAIN;
    double recent_volatility = 0.0;  // stdev of last 20 returns
    double long_volatility = 0.0;    // stdev of last 60 returns
    double volatility_ratio = 0.0;
    double return_30 = 0.0;          // 30-bar simple return
    std::string description;
};

class RegimeDetector {
public:
    static constexpr size_t kMinBars = 61;

    RegimeDetector() = default;

    // Detect current regime from recent closes
    RegimeAnalysis analyzeRegime(const std::vector<double>& closes) const;

private:
    static SizingRegime classifySizing(double volatility_ratio, double return_30);
};

} // namespace analytics
} // namespace quantcore
