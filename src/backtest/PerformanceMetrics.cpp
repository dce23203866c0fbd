#include "backtest/PerformanceMetrics.h"
#include "analytics/Statistics.h"
#include <algorithm>
#include <cmath>
#include <limits>

namespace quantcore {
namespace backtest {

using analytics::Statistics;

namespace {
// 표준편차가 이보다 작으면 평탄한 곡선으로 본다
constexpr double kFlatStdDev = 1e-12;
// Monte Carlo 동률 판정 (상대 오차)
constexpr double kTieTolerance = 1e-9;
}

std::vector<double> PerformanceMetrics::equityReturns(const std::vector<double>& equity_curve) {
    std::vector<double> returns;
    if (equity_curve.size() < 2) return returns;
    returns.reserve(equity_curve.size() - 1);
    for (size_t i = 1; i < equity_curve.size(); ++i) {
        const double prev = equity_curve[i - 1];
        returns.push_back(prev != 0.0 ? (equity_curve[i] - prev) / prev : 0.0);
    }
    return returns;
}

double PerformanceMetrics::maxDrawdown(const std::vector<double>& equity_curve) {
    if (equity_curve.empty()) return 0.0;

    double peak = equity_curve.front();
    double max_dd = 0.0;
    for (double value : equity_curve) {
        peak = std::max(peak, value);
        if (peak > 0.0) {
            max_dd = std::max(max_dd, (peak - value) / peak);
        }
    }
    return max_dd;
}

double PerformanceMetrics::sharpeFromReturns(const std::vector<double>& returns,
                                             double risk_free_rate) {
    if (returns.empty()) return 0.0;
    const double sd = Statistics::stdDev(returns);
    if (sd < kFlatStdDev) return 0.0;
    const double excess = Statistics::mean(returns) - risk_free_rate / kTradingDays;
    return excess / sd * std::sqrt(kTradingDays);
}

double PerformanceMetrics::sharpeRatio(const std::vector<double>& equity_curve, double risk_free_rate) {
    return sharpeFromReturns(equityReturns(equity_curve), risk_free_rate);
}

double PerformanceMetrics::sortinoRatio(const std::vector<double>& equity_curve, double risk_free_rate) {
    const auto returns = equityReturns(equity_curve);
    if (returns.empty()) return 0.0;

    const double target = risk_free_rate / kTradingDays;
    const double excess = Statistics::mean(returns) - target;

    double downside_sq = 0.0;
    bool has_downside = false;
    for (double r : returns) {
        if (r < target) {
            downside_sq += (r - target) * (r - target);
            has_downside = true;
        }
    }

    if (!has_downside) {
        return excess > 0.0 ? std::numeric_limits<double>::infinity() : 0.0;
    }

    // 하방편차는 전체 N 으로 나눈다
    const double downside_dev = std::sqrt(downside_sq / returns.size());
    if (downside_dev < kFlatStdDev) return 0.0;
    return excess / downside_dev * std::sqrt(kTradingDays);
}

double PerformanceMetrics::calmarRatio(const std::vector<double>& equity_curve) {
    if (equity_curve.size() < 2 || equity_curve.front() == 0.0) return 0.0;

    const double total_return = (equity_curve.back() - equity_curve.front()) / equity_curve.front();
    const double periods = static_cast<double>(equity_curve.size() - 1);
    const double annualized = total_return * (kTradingDays / periods);
    const double max_dd = maxDrawdown(equity_curve);

    if (max_dd == 0.0) {
        return annualized > 0.0 ? std::numeric_limits<double>::infinity() : 0.0;
    }
    return annualized / max_dd;
}

double PerformanceMetrics::profitFactor(const std::vector<double>& trade_pnls) {
    double gross_profit = 0.0;
    double gross_loss = 0.0;
    for (double pnl : trade_pnls) {
        if (pnl > 0.0) gross_profit += pnl;
        else gross_loss += std::abs(pnl);
    }
    if (gross_loss > 0.0) return gross_profit / gross_loss;
    return gross_profit > 0.0 ? std::numeric_limits<double>::infinity() : 0.0;
}

MonteCarloResult PerformanceMetrics::monteCarloPermutation(const std::vector<double>& equity_curve,
                                                           std::mt19937_64& rng,
                                                           int iterations) {
    MonteCarloResult result;
    if (equity_curve.size() < kMinMonteCarloPoints) {
        result.error = "Need at least 10 data points";
        return result;
    }
    if (iterations <= 0) {
        result.error = "iterations must be positive";
        return result;
    }

    const auto returns = equityReturns(equity_curve);
    result.observed_sharpe = sharpeFromReturns(returns, 0.0);
    result.iterations = iterations;

    std::vector<double> shuffled(returns);
    std::vector<double> sim_curve;
    sim_curve.reserve(equity_curve.size());
    std::vector<double> sharpes;
    sharpes.reserve(iterations);

    for (int iter = 0; iter < iterations; ++iter) {
        shuffled = returns;
        // Fisher-Yates
        for (size_t i = shuffled.size() - 1; i > 0; --i) {
            std::uniform_int_distribution<size_t> pick(0, i);
            std::swap(shuffled[i], shuffled[pick(rng)]);
        }

        sim_curve.clear();
        sim_curve.push_back(equity_curve.front());
        for (double r : shuffled) {
            sim_curve.push_back(sim_curve.back() * (1.0 + r));
        }
        sharpes.push_back(sharpeRatio(sim_curve));
    }

    std::sort(sharpes.begin(), sharpes.end());

    const double tolerance = kTieTolerance * std::max(1.0, std::abs(result.observed_sharpe));
    const auto beat_count = std::count_if(sharpes.begin(), sharpes.end(), [&](double s) {
        return s >= result.observed_sharpe - tolerance;
    });

    result.p_value = static_cast<double>(beat_count) / iterations;
    result.percentile = static_cast<int>(std::lround((1.0 - result.p_value) * 100.0));
    result.median_random_sharpe = sharpes[sharpes.size() / 2];
    return result;
}

void PerformanceMetrics::fillReport(PerformanceReport& report,
                                    const std::vector<double>& trade_pnls,
                                    const std::vector<int>& durations,
                                    double risk_free_rate) {
    const auto& curve = report.equity_curve;

    double gross_profit = 0.0;
    double gross_loss = 0.0;
    report.wins = 0;
    report.losses = 0;
    for (double pnl : trade_pnls) {
        if (pnl > 0.0) {
            ++report.wins;
            gross_profit += pnl;
        } else {
            ++report.losses;
            gross_loss += std::abs(pnl);
        }
    }

    report.total_trades = static_cast<int>(trade_pnls.size());
    report.total_pnl = report.final_balance - report.initial_balance;
    report.total_return = report.initial_balance > 0.0
        ? report.total_pnl / report.initial_balance * 100.0 : 0.0;
    report.win_rate = report.total_trades > 0
        ? static_cast<double>(report.wins) / report.total_trades * 100.0 : 0.0;
    report.avg_win = report.wins > 0 ? gross_profit / report.wins : 0.0;
    report.avg_loss = report.losses > 0 ? gross_loss / report.losses : 0.0;
    report.profit_factor = profitFactor(trade_pnls);
    report.max_drawdown = maxDrawdown(curve) * 100.0;
    report.sharpe = sharpeRatio(curve, risk_free_rate);
    report.sortino = sortinoRatio(curve, risk_free_rate);
    report.calmar = calmarRatio(curve);

    double duration_sum = 0.0;
    for (int d : durations) duration_sum += d;
    report.avg_duration_bars = durations.empty() ? 0.0 : duration_sum / durations.size();
}

} // namespace backtest
} // namespace quantcore
