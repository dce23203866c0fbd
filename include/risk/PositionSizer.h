#pragma once

#include "risk/SizingConfig.h"
#include "analytics/RegimeDetector.h"
#include <map>
#include <optional>
#include <random>
#include <string>
#include <vector>

namespace quantcore {
namespace risk {

using analytics::SizingRegime;

// 청산된 거래 1건의 결과 (pnl_pct 는 분수: 0.05 = +5%)
struct TradeRecord {
    double pnl = 0.0;
    double pnl_pct = 0.0;

    TradeRecord() = default;
    explicit TradeRecord(double pct) : pnl(0.0), pnl_pct(pct) {}
};

struct KellyEstimate {
    double win_rate = 0.0;
    double avg_win = 0.0;
    double avg_loss = 0.0;
    double kelly_pct = 0.0;
    double sample_size = 0.0;   // effective sample size for weighted estimates
};

struct OptimalFResult {
    double optimal_f = 0.0;
    double terminal_wealth = 1.0;
    double worst_loss = 0.0;
    double position_pct = 0.0;
};

struct KellyConfidenceInterval {
    double lower = 0.0;
    double median = 0.0;
    double upper = 0.0;
    double spread = 0.0;
    int resamples = 0;
};

struct PortfolioPosition {
    std::string name;
    double kelly_pct = 0.0;
    std::vector<double> returns;
};

struct PortfolioAllocation {
    std::string name;
    double kelly_pct = 0.0;
    double adjusted_pct = 0.0;
    double avg_abs_correlation = 0.0;
    double diversification_factor = 1.0;
};

struct SizingRequest {
    double portfolio_value = 0.0;
    double price = 0.0;
    double confidence = 0.0;

    // 명시적 Kelly 통계 (세 값 모두 있어야 사용)
    std::optional<double> win_rate;
    std::optional<double> avg_win_return;
    std::optional<double> avg_loss_return;

    std::string strategy_name;              // 기본 Kelly 파라미터 조회용
    std::vector<TradeRecord> trades;        // rolling / exponential Kelly, adaptive fraction
    std::optional<SizingRegime> regime;
    std::optional<double> current_drawdown; // 0 ~ 1
    std::vector<double> returns;            // VaR / CVaR 제약용 수익률
    bool use_var_constraint = false;
    bool use_cvar_constraint = false;       // VaR 보다 우선
    std::optional<double> transaction_cost_pct;  // round-trip
    std::optional<double> volatility;       // daily return stdev
    bool use_adaptive_fraction = false;
    bool use_exponential_weighting = false;
};

struct PositionSizingResult {
    double quantity = 0.0;
    double notional_value = 0.0;
    std::string method;         // e.g. "kelly+regime+dd_adjusted+cvar"
    double position_pct = 0.0;  // percent of portfolio
    std::string reason;

    bool isSkipped() const { return quantity <= 0.0; }
};

// Kelly 계열 포지션 사이징 + 꼬리위험 / 낙폭 / 비용 / 상관 제약
class PositionSizer {
public:
    static constexpr size_t kMinTradesForEstimate = 10;
    static constexpr size_t kMinTradesForBootstrap = 15;

    explicit PositionSizer(PositionSizerConfig config = PositionSizerConfig());

    PositionSizingResult calculate(const SizingRequest& request) const;

    // (p*W - (1-p)*L) / W * fraction, clamped to [0, max_yolo_pct]
    double kellySize(double win_rate, double avg_win, double avg_loss) const;
    double kellySize(double win_rate, double avg_win, double avg_loss, double fraction) const;

    static double regimeKellyFraction(SizingRegime regime);
    double regimeAdjustedKelly(double win_rate, double avg_win, double avg_loss,
                               SizingRegime regime) const;
    double drawdownAdjustedKelly(double kelly_pct, double current_drawdown) const;
    double adaptiveKellyFraction(size_t sample_size,
                                 std::optional<SizingRegime> regime = std::nullopt) const;

    double varConstrainedKelly(double kelly_pct, const std::vector<double>& returns,
                               double max_var_pct) const;
    double cvarConstrainedKelly(double kelly_pct, const std::vector<double>& returns,
                                double max_cvar_pct) const;
    double costAdjustedKelly(double kelly_pct, double round_trip_cost_pct, double avg_win) const;

    std::optional<KellyEstimate> rollingKellyEstimate(const std::vector<TradeRecord>& trades) const;
    std::optional<KellyEstimate> exponentialKellyEstimate(const std::vector<TradeRecord>& trades,
                                                          double half_life) const;
    std::optional<OptimalFResult> optimalF(const std::vector<TradeRecord>& trades) const;
    std::optional<KellyConfidenceInterval> kellyConfidenceInterval(
        const std::vector<TradeRecord>& trades, std::mt19937_64& rng,
        int resamples = 1000, double alpha = 0.05) const;

    double strategyKellySize(const std::string& strategy_name,
                             std::optional<SizingRegime> regime,
                             const std::vector<TradeRecord>& trades) const;

    std::vector<PortfolioAllocation> portfolioKelly(const std::vector<PortfolioPosition>& positions) const;

    // Inverse-volatility weights; non-positive volatilities are ignored
    static std::map<std::string, double> riskParityWeights(const std::map<std::string, double>& volatilities);

    const PositionSizerConfig& config() const { return config_; }

private:
    PositionSizerConfig config_;
};

} // namespace risk
} // namespace quantcore
