#pragma once

#include <vector>
#include <optional>
#include "common/Types.h"

namespace quantcore {
namespace analytics {

// Technical Indicators - 검증된 공식으로 구현
class TechnicalIndicators {
public:
    // RSI (Relative Strength Index), Wilder smoothing
    // 70 이상: 과매수, 30 이하: 과매도
    static std::optional<double> calculateRSI(const std::vector<double>& prices, int period = 14);
    
    struct MACDResult {
        double macd;        // MACD 선
        double signal;      // Signal 선
        double histogram;   // MACD - Signal
        
        MACDResult() : macd(0), signal(0), histogram(0) {}
    };
    static std::optional<MACDResult> calculateMACD(const std::vector<double>& prices,
                                                   int fast = 12, int slow = 26, int signal_period = 9);
    
    struct BollingerBands {
        double upper;
        double middle;      // SMA
        double lower;
        double width;
        double percent_b;   // 0 = 하단, 1 = 상단
        
        BollingerBands() : upper(0), middle(0), lower(0), width(0), percent_b(0.5) {}
    };
    static std::optional<BollingerBands> calculateBollingerBands(const std::vector<double>& prices,
                                                                 double current_price,
                                                                 int period = 20,
                                                                 double std_dev_mult = 2.0);
    
    static double calculateEMA(const std::vector<double>& prices, int period);
    static std::vector<double> calculateEMAVector(const std::vector<double>& prices, int period);
    static double calculateSMA(const std::vector<double>& prices, int period);

    // 직전 19개 평균 대비 threshold 배 이상이면 급증
    static bool detectVolumeSpike(const std::vector<double>& volumes, double threshold = 2.0);
    
    static std::vector<double> extractClosePrices(const std::vector<Candle>& candles);
    static std::vector<double> extractVolumes(const std::vector<Candle>& candles);
};

} // namespace analytics
} // namespace quantcore
