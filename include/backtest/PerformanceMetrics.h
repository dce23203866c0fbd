#pragma once

#include "backtest/BacktestReport.h"
#include <random>
#include <string>
#include <vector>

namespace quantcore {
namespace backtest {

struct MonteCarloResult {
    double observed_sharpe = 0.0;
    double p_value = 1.0;
    int percentile = 0;
    double median_random_sharpe = 0.0;
    int iterations = 0;
    std::string error;

    bool ok() const { return error.empty(); }
};

// 자산곡선 기반 성과 지표 (일봉 가정, 연 252 거래일)
class PerformanceMetrics {
public:
    static constexpr double kTradingDays = 252.0;
    static constexpr size_t kMinMonteCarloPoints = 10;

    static std::vector<double> equityReturns(const std::vector<double>& equity_curve);

    // Fraction of peak (0.25 = 25%)
    static double maxDrawdown(const std::vector<double>& equity_curve);
    static double sharpeRatio(const std::vector<double>& equity_curve, double risk_free_rate = 0.0);
    // Downside deviation is taken over all N returns
    static double sortinoRatio(const std::vector<double>& equity_curve, double risk_free_rate = 0.0);
    static double calmarRatio(const std::vector<double>& equity_curve);
    static double profitFactor(const std::vector<double>& trade_pnls);

    static MonteCarloResult monteCarloPermutation(const std::vector<double>& equity_curve,
                                                  std::mt19937_64& rng,
                                                  int iterations = 1000);

    // 거래 손익 / 보유기간 / 자산곡선으로 공통 리포트 필드를 채운다
    static void fillReport(PerformanceReport& report,
                           const std::vector<double>& trade_pnls,
                           const std::vector<int>& durations,
                           double risk_free_rate = 0.0);

private:
    static double sharpeFromReturns(const std::vector<double>& returns, double risk_free_rate);
};

} // namespace backtest
} // namespace quantcore
