#include "backtest/PerformanceMetrics.h"
#include "analytics/Statistics.h"
#include "TestHelpers.h"

#include <cassert>
#include <cmath>
#include <iostream>
#include <limits>
#include <random>

using quantcore::backtest::MonteCarloResult;
using quantcore::backtest::PerformanceMetrics;
using quantcore::backtest::PerformanceReport;
using testutil::near;

namespace {

// +1% / -0.5% 교대
std::vector<double> alternatingCurve(size_t bars) {
    std::vector<double> curve{100000.0};
    for (size_t i = 0; i < bars; ++i) {
        curve.push_back(curve.back() * (1.0 + (i % 2 == 0 ? 0.01 : -0.005)));
    }
    return curve;
}

} // namespace

static void testDrawdown() {
    assert(near(PerformanceMetrics::maxDrawdown({100, 120, 90, 130, 65}), 0.5));
    assert(PerformanceMetrics::maxDrawdown({100, 110, 120}) == 0.0);
    assert(PerformanceMetrics::maxDrawdown({}) == 0.0);
    std::cout << "[TEST] Max drawdown PASSED\n";
}

static void testSharpeSortino() {
    auto curve = alternatingCurve(100);
    // mean 0.0025, population sd 0.0075
    const double sharpe = PerformanceMetrics::sharpeRatio(curve);
    assert(near(sharpe, 0.0025 / 0.0075 * std::sqrt(252.0), 1e-6));

    // downside: 50 x 0.005^2 / 100
    const double sortino = PerformanceMetrics::sortinoRatio(curve);
    assert(near(sortino, 0.0025 / std::sqrt(0.000025 / 2.0) * std::sqrt(252.0), 1e-6));
    // 평균이 양수일 때만 Sortino >= Sharpe
    assert(sortino >= sharpe);

    // 음수 평균 (+5% 후 -1% x 10): 하방편차가 표준편차보다 작아 Sortino 가 더 음수
    std::vector<double> losing{100000.0};
    losing.push_back(losing.back() * 1.05);
    for (int i = 0; i < 10; ++i) losing.push_back(losing.back() * 0.99);
    const double losing_sharpe = PerformanceMetrics::sharpeRatio(losing);
    const double losing_sortino = PerformanceMetrics::sortinoRatio(losing);
    assert(losing_sharpe < 0.0);
    assert(losing_sortino < losing_sharpe);

    // 무위험수익률 반영 시 감소
    assert(PerformanceMetrics::sharpeRatio(curve, 0.05) < sharpe);

    auto flat = std::vector<double>(50, 100000.0);
    assert(PerformanceMetrics::sharpeRatio(flat) == 0.0);
    assert(PerformanceMetrics::sortinoRatio(flat) == 0.0);

    auto rising = testutil::compoundCurve(50, 0.001);
    assert(PerformanceMetrics::sharpeRatio(rising) == 0.0);   // sd = 0
    assert(std::isinf(PerformanceMetrics::sortinoRatio(rising)));
    assert(PerformanceMetrics::sharpeRatio({100000.0}) == 0.0);
    std::cout << "[TEST] Sharpe / Sortino PASSED\n";
}

static void testCalmarAndProfitFactor() {
    auto rising = testutil::compoundCurve(50, 0.001);
    assert(std::isinf(PerformanceMetrics::calmarRatio(rising)));
    assert(PerformanceMetrics::calmarRatio(std::vector<double>(20, 100.0)) == 0.0);

    std::vector<double> dip{100, 110, 99, 121};
    // total 21%, 3 periods -> 0.21 * 84, dd = 10%
    assert(near(PerformanceMetrics::calmarRatio(dip), 0.21 * 84.0 / 0.1, 1e-9));
    std::vector<double> falling{100, 90, 80};
    assert(PerformanceMetrics::calmarRatio(falling) < 0.0);

    assert(near(PerformanceMetrics::profitFactor({100.0, -50.0, 50.0}), 3.0));
    assert(std::isinf(PerformanceMetrics::profitFactor({10.0})));
    assert(PerformanceMetrics::profitFactor({}) == 0.0);
    assert(PerformanceMetrics::profitFactor({-5.0}) == 0.0);
    std::cout << "[TEST] Calmar / profit factor PASSED\n";
}

static void testMonteCarlo() {
    std::mt19937_64 rng(42);

    // 일정 수익률: 셔플해도 Sharpe 동일 -> 유의하지 않음
    auto linear = testutil::compoundCurve(60, 0.002);
    auto flat_result = PerformanceMetrics::monteCarloPermutation(linear, rng, 200);
    assert(flat_result.ok());
    assert(flat_result.p_value == 1.0);
    assert(flat_result.percentile == 0);
    assert(flat_result.iterations == 200);

    // 분산이 있는 반복 수익률 (+2%, -1%, +0.5%): 셔플 Sharpe 는 부동소수 오차만큼만 다르고
    // 상대 허용 오차로 모두 동률 처리되어야 한다
    std::vector<double> cycle{100000.0};
    const double cycle_returns[] = {0.02, -0.01, 0.005};
    for (size_t i = 0; i < 60; ++i) cycle.push_back(cycle.back() * (1.0 + cycle_returns[i % 3]));
    auto tie_result = PerformanceMetrics::monteCarloPermutation(cycle, rng, 500);
    assert(tie_result.ok());
    assert(tie_result.observed_sharpe > 1.0);
    assert(tie_result.p_value == 1.0);
    assert(tie_result.percentile == 0);
    assert(near(tie_result.median_random_sharpe, tie_result.observed_sharpe, 1e-9));

    // Sharpe 는 수익률 순서와 무관
    auto curve = alternatingCurve(60);
    auto result = PerformanceMetrics::monteCarloPermutation(curve, rng, 300);
    assert(result.ok());
    assert(result.p_value > 0.95);
    assert(near(result.median_random_sharpe, result.observed_sharpe, 1e-6));

    // 같은 seed -> 같은 결과
    std::mt19937_64 a(7), b(7);
    auto r1 = PerformanceMetrics::monteCarloPermutation(curve, a, 100);
    auto r2 = PerformanceMetrics::monteCarloPermutation(curve, b, 100);
    assert(r1.p_value == r2.p_value && r1.median_random_sharpe == r2.median_random_sharpe);

    auto too_short = PerformanceMetrics::monteCarloPermutation(std::vector<double>(9, 1.0), rng);
    assert(!too_short.ok());
    assert(too_short.error == "Need at least 10 data points");
    auto no_iter = PerformanceMetrics::monteCarloPermutation(curve, rng, 0);
    assert(!no_iter.ok());
    std::cout << "[TEST] Monte Carlo permutation PASSED\n";
}

static void testFillReport() {
    PerformanceReport report;
    report.initial_balance = 100000.0;
    report.final_balance = 100150.0;
    report.equity_curve = {100000.0, 100200.0, 99900.0, 100150.0};
    PerformanceMetrics::fillReport(report, {300.0, -100.0, -50.0}, {4, 2, 3});

    assert(report.total_trades == 3);
    assert(report.wins == 1 && report.losses == 2);
    assert(near(report.total_pnl, 150.0));
    assert(near(report.total_return, 0.15));
    assert(near(report.win_rate, 100.0 / 3.0));
    assert(near(report.avg_win, 300.0));
    assert(near(report.avg_loss, 75.0));
    assert(near(report.profit_factor, 2.0));
    assert(near(report.max_drawdown, 300.0 / 100200.0 * 100.0));
    assert(near(report.avg_duration_bars, 3.0));
    assert(report.ok());
    std::cout << "[TEST] Report fill PASSED\n";
}

static void testTailRiskOrdering() {
    auto curve = alternatingCurve(120);
    auto returns = PerformanceMetrics::equityReturns(curve);
    returns[10] = -0.04;
    returns[50] = -0.03;
    returns[90] = -0.06;
    using quantcore::analytics::Statistics;
    for (double level : {0.90, 0.95, 0.99}) {
        auto var = Statistics::valueAtRisk(returns, level);
        auto cvar = Statistics::conditionalValueAtRisk(returns, level);
        assert(var && cvar);
        assert(*cvar >= *var);
    }
    std::cout << "[TEST] CVaR >= VaR PASSED\n";
}

int main() {
    testDrawdown();
    testSharpeSortino();
    testCalmarAndProfitFactor();
    testMonteCarlo();
    testFillReport();
    testTailRiskOrdering();
    std::cout << "[TEST] PerformanceMetrics PASSED\n";
    return 0;
}
