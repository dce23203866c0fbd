#include "backtest/PairsBacktestEngine.h"
#include "backtest/PerformanceMetrics.h"
#include "strategy/PairsTradingStrategy.h"
#include "common/Logger.h"
#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <fmt/format.h>

namespace quantcore {
namespace backtest {

using execution::FillContext;

PairsBacktestEngine::PairsBacktestEngine(std::shared_ptr<strategy::IPairStrategy> strategy,
                                         std::shared_ptr<risk::PositionSizer> sizer,
                                         std::shared_ptr<execution::ExecutionModel> execution,
                                         BacktestConfig config)
    : strategy_(std::move(strategy))
    , sizer_(std::move(sizer))
    , execution_(std::move(execution))
    , config_(config)
{
    if (!strategy_) {
        throw std::invalid_argument("PairsBacktestEngine: strategy is required");
    }
    if (!sizer_) {
        throw std::invalid_argument("PairsBacktestEngine: position sizer is required");
    }
    if (config_.pairs_lookback < 2 || config_.initial_balance <= 0.0) {
        throw std::invalid_argument("PairsBacktestEngine: pairs_lookback >= 2 and initial_balance > 0 required");
    }
}

std::optional<PairsBacktestEngine::SpreadPosition> PairsBacktestEngine::openPosition(
    const strategy::Signal& signal, double price_a, double price_b, double cash, int bar,
    execution::ExecutionModel* costs) const {
    const int direction = signal.direction();
    if (direction == 0 || !signal.hedge_ratio) return std::nullopt;

    const double hedge = std::abs(*signal.hedge_ratio);
    const double unit_price = price_a + hedge * price_b;

    // 스프레드 1 단위 = A 1주 + B |h|주
    risk::SizingRequest request;
    request.portfolio_value = cash;
    request.price = unit_price;
    request.confidence = signal.confidence;
    const auto sizing = sizer_->calculate(request);
    if (sizing.quantity <= 0.0) return std::nullopt;

    const auto legs = strategy::PairsTradingStrategy::getPositionLegs(
        sizing.notional_value, price_a, price_b, hedge);
    if (legs.quantity_a <= 0.0) return std::nullopt;

    SpreadPosition position;
    position.direction = direction;
    position.hedge_ratio = hedge;
    position.quantity_a = legs.quantity_a;
    position.quantity_b = legs.quantity_b;
    position.entry_price_a = price_a;
    position.entry_price_b = price_b;
    position.entry_bar = bar;

    if (costs) {
        const OrderSide side_a = direction > 0 ? OrderSide::BUY : OrderSide::SELL;
        const OrderSide side_b = direction > 0 ? OrderSide::SELL : OrderSide::BUY;
        position.entry_price_a = costs->getExecutionPrice(side_a, price_a, FillContext(legs.quantity_a));
        position.entry_price_b = costs->getExecutionPrice(side_b, price_b, FillContext(legs.quantity_b));
        position.entry_fees = costs->getCommission(position.entry_price_a, legs.quantity_a)
                            + costs->getCommission(position.entry_price_b, legs.quantity_b);
    }
    return position;
}

double PairsBacktestEngine::markToMarket(const SpreadPosition& position, double price_a, double price_b) {
    const double pnl_a = (price_a - position.entry_price_a) * position.quantity_a * position.direction;
    const double pnl_b = (position.entry_price_b - price_b) * position.quantity_b * position.direction;
    return pnl_a + pnl_b;
}

PairTrade PairsBacktestEngine::closePosition(const SpreadPosition& position, double price_a,
                                             double price_b, int bar,
                                             const std::string& exit_reason,
                                             const std::string& pair_label,
                                             execution::ExecutionModel* costs, double& cash) const {
    double exit_a = price_a;
    double exit_b = price_b;
    double exit_fees = 0.0;
    if (costs) {
        const OrderSide side_a = position.direction > 0 ? OrderSide::SELL : OrderSide::BUY;
        const OrderSide side_b = position.direction > 0 ? OrderSide::BUY : OrderSide::SELL;
        exit_a = costs->getExecutionPrice(side_a, price_a, FillContext(position.quantity_a));
        exit_b = costs->getExecutionPrice(side_b, price_b, FillContext(position.quantity_b));
        exit_fees = costs->getCommission(exit_a, position.quantity_a)
                  + costs->getCommission(exit_b, position.quantity_b);
    }

    const double gross = (exit_a - position.entry_price_a) * position.quantity_a * position.direction
                       + (position.entry_price_b - exit_b) * position.quantity_b * position.direction;

    // 진입 수수료는 진입 시 이미 현금에서 차감
    cash += gross - exit_fees;

    PairTrade trade;
    trade.direction = position.direction;
    trade.entry_bar = position.entry_bar;
    trade.exit_bar = bar;
    trade.duration_bars = bar - position.entry_bar;
    trade.hedge_ratio = position.hedge_ratio;
    trade.quantity_a = position.quantity_a;
    trade.quantity_b = position.quantity_b;
    trade.entry_price_a = position.entry_price_a;
    trade.entry_price_b = position.entry_price_b;
    trade.exit_price_a = exit_a;
    trade.exit_price_b = exit_b;
    trade.fees = position.entry_fees + exit_fees;
    trade.pnl = gross - trade.fees;
    trade.pnl_pct = trade.pnl / config_.initial_balance * 100.0;
    trade.exit_reason = exit_reason;

    Logger::getInstance().logTrade(pair_label,
                                   position.direction > 0 ? "CLOSE_LONG_SPREAD" : "CLOSE_SHORT_SPREAD",
                                   exit_a, position.quantity_a, trade.pnl);
    return trade;
}

PairsBacktestReport PairsBacktestEngine::run(const std::vector<double>& closes_a,
                                             const std::vector<double>& closes_b,
                                             const std::string& symbol_a,
                                             const std::string& symbol_b) const {
    PairsBacktestReport report;
    report.symbol_a = symbol_a;
    report.symbol_b = symbol_b;
    report.initial_balance = config_.initial_balance;

    const size_t n = std::min(closes_a.size(), closes_b.size());
    report.data_points = n;
    const size_t lookback = config_.pairs_lookback;

    if (n < lookback) {
        report.error = fmt::format("Need at least {} data points, got {}", lookback, n);
        report.final_balance = config_.initial_balance;
        LOG_WARN("[PairsBacktest] {}/{} skipped: {}", symbol_a, symbol_b, report.error);
        return report;
    }

    // 비용 누적은 run 단위
    std::optional<execution::ExecutionModel> run_costs;
    if (execution_) run_costs.emplace(execution_->config());
    execution::ExecutionModel* costs = run_costs ? &*run_costs : nullptr;
    const std::string pair_label = symbol_a + "/" + symbol_b;

    double cash = config_.initial_balance;
    std::optional<SpreadPosition> position;
    std::vector<double> pnls;
    std::vector<int> durations;

    auto record = [&](PairTrade trade) {
        pnls.push_back(trade.pnl);
        durations.push_back(trade.duration_bars);
        report.exit_reasons[trade.exit_reason]++;
        report.trades.push_back(std::move(trade));
    };

    auto enter = [&](const strategy::Signal& signal, double price_a, double price_b, int bar) {
        position = openPosition(signal, price_a, price_b, cash, bar, costs);
        if (position) cash -= position->entry_fees;
    };

    report.equity_curve.reserve(n - lookback + 1);
    report.equity_curve.push_back(config_.initial_balance);

    LOG_INFO("[PairsBacktest] {}/{} start - strategy {}, {} bars, lookback {}",
             symbol_a, symbol_b, strategy_->getName(), n, lookback);

    for (size_t i = lookback; i < n; ++i) {
        const int bar = static_cast<int>(i);
        const std::vector<double> window_a(closes_a.begin() + (i - lookback), closes_a.begin() + i + 1);
        const std::vector<double> window_b(closes_b.begin() + (i - lookback), closes_b.begin() + i + 1);
        const double price_a = closes_a[i];
        const double price_b = closes_b[i];

        const auto signal = strategy_->generateSignal(window_a, window_b);
        const int direction = signal.direction();
        const bool tradeable = direction != 0 && signal.confidence > config_.min_confidence;

        if (position) {
            // 평균 회귀(0) 또는 반대 방향 신호면 청산
            if (direction == 0 || direction == -position->direction) {
                const std::string reason = direction == 0 ? "mean_reversion" : "signal_flip";
                record(closePosition(*position, price_a, price_b, bar, reason, pair_label, costs, cash));
                position.reset();

                if (tradeable) enter(signal, price_a, price_b, bar);
            }
        } else if (tradeable) {
            enter(signal, price_a, price_b, bar);
        }

        const double unrealized = position ? markToMarket(*position, price_a, price_b) : 0.0;
        report.equity_curve.push_back(cash + unrealized);
    }

    if (position) {
        record(closePosition(*position, closes_a[n - 1], closes_b[n - 1],
                             static_cast<int>(n - 1), "end_of_data", pair_label, costs, cash));
        position.reset();
    }

    report.final_balance = cash;
    if (costs) report.execution_costs = costs->report();
    PerformanceMetrics::fillReport(report, pnls, durations, config_.risk_free_rate);

    LOG_INFO("[PairsBacktest] {}/{} done - trades {}, pnl {:.2f} ({:.2f}%), sharpe {:.2f}",
             symbol_a, symbol_b, report.total_trades, report.total_pnl,
             report.total_return, report.sharpe);
    return report;
}

} // namespace backtest
} // namespace quantcore
