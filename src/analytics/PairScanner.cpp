#include "analytics/PairScanner.h"
#include "analytics/Statistics.h"
#include "common/Logger.h"
#include <algorithm>
#include <cmath>
#include <iterator>
#include <stdexcept>

namespace quantcore {
namespace analytics {

PairScanner::PairScanner(PairScannerConfig config, strategy::PairsTradingConfig pairs_config)
    : config_(config)
    , pairs_(pairs_config) {
    if (config_.min_correlation < -1.0 || config_.min_correlation > 1.0 || config_.max_results == 0 ||
        !(config_.target_half_life > 0.0)) {
        throw std::invalid_argument("PairScanner: invalid configuration");
    }
}

double PairScanner::compositeScore(const strategy::CointegrationResult& result) const {
    double score = 0.0;

    if (result.adf_statistic) {
        score += 0.40 * std::clamp(-*result.adf_statistic / 5.0, 0.0, 1.0);
    }
    if (result.hurst_exponent) {
        score += 0.25 * std::clamp((0.6 - *result.hurst_exponent) / 0.3, 0.0, 1.0);
    }
    if (result.half_life_bars) {
        const double distance = std::abs(*result.half_life_bars - config_.target_half_life);
        score += 0.20 / (1.0 + distance / config_.target_half_life);
    }
    if (result.johansen_rank >= 1) {
        score += 0.15;
    }
    return score;
}

std::vector<PairCandidate> PairScanner::scan(
    const std::map<std::string, std::vector<double>>& universe) const {
    std::vector<PairCandidate> candidates;
    int tested = 0;
    int filtered = 0;

    for (auto it_a = universe.begin(); it_a != universe.end(); ++it_a) {
        for (auto it_b = std::next(it_a); it_b != universe.end(); ++it_b) {
            ++tested;

            // 1. 저비용 상관 필터
            const auto corr = Statistics::pearsonCorrelation(it_a->second, it_b->second);
            if (!corr || *corr < config_.min_correlation) {
                ++filtered;
                continue;
            }

            // 2. 고비용 검정 (ADF / Hurst / half-life / Johansen)
            const auto spread = pairs_.computeSpread(it_a->second, it_b->second);
            if (!spread) {
                ++filtered;
                continue;
            }

            PairCandidate candidate;
            candidate.symbol_a = it_a->first;
            candidate.symbol_b = it_b->first;
            candidate.correlation = *corr;
            candidate.hedge_ratio = spread->hedge_ratio;
            candidate.cointegration = pairs_.evaluateCointegration(*spread, it_a->second, it_b->second);
            candidate.score = compositeScore(candidate.cointegration);

            if (candidate.cointegration.is_cointegrated && candidate.score >= config_.min_score) {
                candidates.push_back(std::move(candidate));
            }
        }
    }

    std::sort(candidates.begin(), candidates.end(), [](const PairCandidate& lhs, const PairCandidate& rhs) {
        if (lhs.score != rhs.score) return lhs.score > rhs.score;
        if (lhs.symbol_a != rhs.symbol_a) return lhs.symbol_a < rhs.symbol_a;
        return lhs.symbol_b < rhs.symbol_b;
    });
    if (candidates.size() > config_.max_results) {
        candidates.resize(config_.max_results);
    }

    LOG_INFO("Pair scan: {} symbols, {} pairs tested, {} pre-filtered, {} qualified",
             universe.size(), tested, filtered, candidates.size());
    return candidates;
}

} // namespace analytics
} // namespace quantcore
