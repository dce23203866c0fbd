#pragma once

#include "strategy/PairsTradingStrategy.h"
#include "strategy/StrategyConfig.h"
#include <map>
#include <string>
#include <vector>

namespace quantcore {
namespace analytics {

struct PairScannerConfig {
    double min_correlation = 0.5;   // 가격 상관 사전 필터
    double min_score = 0.0;
    size_t max_results = 20;
    double target_half_life = 10.0;
};

struct PairCandidate {
    std::string symbol_a;
    std::string symbol_b;
    double correlation = 0.0;
    double hedge_ratio = 0.0;
    double score = 0.0;
    strategy::CointegrationResult cointegration;
};

// 후보 종목 전체 페어 스캔 및 랭킹, O(n^2)
class PairScanner {
public:
    explicit PairScanner(PairScannerConfig config = PairScannerConfig(),
                         strategy::PairsTradingConfig pairs_config = strategy::PairsTradingConfig());

    // universe: symbol -> close prices (ascending time)
    std::vector<PairCandidate> scan(const std::map<std::string, std::vector<double>>& universe) const;

    // ADF strength 40%, Hurst quality 25%, half-life proximity 20%, Johansen bonus 15%
    double compositeScore(const strategy::CointegrationResult& result) const;

private:
    PairScannerConfig config_;
    strategy::PairsTradingStrategy pairs_;
};

} // namespace analytics
} // namespace quantcore
