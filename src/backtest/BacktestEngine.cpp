#include "backtest/BacktestEngine.h"
#include "backtest/PerformanceMetrics.h"
#include "analytics/Statistics.h"
#include "analytics/TechnicalIndicators.h"
#include "common/Logger.h"
#include <algorithm>
#include <cmath>
#include <optional>
#include <stdexcept>
#include <fmt/format.h>

namespace quantcore {
namespace backtest {

using analytics::Statistics;
using execution::FillContext;

BacktestEngine::BacktestEngine(std::shared_ptr<strategy::IStrategy> strategy,
                               std::shared_ptr<risk::PositionSizer> sizer,
                               std::shared_ptr<execution::ExecutionModel> execution,
                               BacktestConfig config)
    : strategy_(std::move(strategy))
    , sizer_(std::move(sizer))
    , execution_(std::move(execution))
    , config_(config)
{
    if (!strategy_) {
        throw std::invalid_argument("BacktestEngine: strategy is required");
    }
    if (!sizer_) {
        throw std::invalid_argument("BacktestEngine: position sizer is required");
    }
    if (config_.lookback < 2 || config_.initial_balance <= 0.0) {
        throw std::invalid_argument("BacktestEngine: lookback >= 2 and initial_balance > 0 required");
    }
}

risk::SizingRequest BacktestEngine::buildSizingRequest(const std::vector<double>& history_closes,
                                                       double portfolio_value, double price,
                                                       double confidence,
                                                       const RunLedger& ledger) const {
    risk::SizingRequest request;
    request.portfolio_value = portfolio_value;
    request.price = price;
    request.confidence = confidence;

    if (config_.use_regime_sizing) {
        // 국면 판정은 최근 kMinBars 만 사용
        const size_t n = std::min(history_closes.size(), analytics::RegimeDetector::kMinBars);
        std::vector<double> tail(history_closes.end() - n, history_closes.end());
        auto regime = regime_detector_.analyzeRegime(tail);
        if (regime.regime != analytics::MarketRegime::UNKNOWN) {
            request.regime = regime.sizing_regime;
        }
        request.strategy_name = strategy_->getName();
        request.trades = ledger.trades;
    }
    return request;
}

void BacktestEngine::closePosition(const std::string& symbol, OpenPosition& position, double price,
                                   const FillContext& context, int bar,
                                   const std::string& exit_reason, execution::ExecutionModel* costs,
                                   Portfolio& portfolio, RunLedger& ledger, BacktestReport& report) {
    double exec_price = price;
    double fee = 0.0;
    if (costs) {
        exec_price = costs->getExecutionPrice(OrderSide::SELL, price, context);
        fee = costs->getCommission(exec_price, position.quantity);
    }

    portfolio.cash += exec_price * position.quantity - fee;
    portfolio.positions.erase(symbol);

    // 수수료 포함 순손익
    const double pnl = (exec_price - position.entry_price) * position.quantity
                     - position.entry_fee - fee;
    const double cost_basis = position.entry_price * position.quantity + position.entry_fee;

    Trade trade;
    trade.symbol = symbol;
    trade.side = OrderSide::SELL;
    trade.quantity = position.quantity;
    trade.price = price;
    trade.realized_price = exec_price;
    trade.fee = fee;
    trade.pnl = pnl;
    trade.duration_bars = bar - position.entry_bar;
    trade.exit_reason = exit_reason;
    trade.bar_index = bar;
    report.trades.push_back(trade);
    report.exit_reasons[exit_reason]++;

    ledger.pnls.push_back(pnl);
    ledger.durations.push_back(bar - position.entry_bar);
    ledger.trades.emplace_back(cost_basis > 0.0 ? pnl / cost_basis : 0.0);
    ledger.trades.back().pnl = pnl;

    Logger::getInstance().logTrade(symbol, toString(OrderSide::SELL), exec_price,
                                   position.quantity, pnl);
    position = OpenPosition();
}

BacktestReport BacktestEngine::run(const std::string& symbol, const std::vector<Candle>& candles) const {
    BacktestReport report;
    report.symbol = symbol;
    report.initial_balance = config_.initial_balance;

    if (candles.size() < config_.lookback) {
        report.error = fmt::format("Need at least {} candles, got {}", config_.lookback, candles.size());
        report.final_balance = config_.initial_balance;
        LOG_WARN("[Backtest] {} skipped: {}", symbol, report.error);
        return report;
    }

    // 비용 누적은 run 단위
    std::optional<execution::ExecutionModel> run_costs;
    if (execution_) run_costs.emplace(execution_->config());
    execution::ExecutionModel* costs = run_costs ? &*run_costs : nullptr;
    RunLedger ledger;

    Portfolio portfolio;
    portfolio.cash = config_.initial_balance;
    OpenPosition position;
    bool in_position = false;

    const std::vector<double> all_closes = analytics::TechnicalIndicators::extractClosePrices(candles);

    report.equity_curve.reserve(candles.size() - config_.lookback + 1);
    report.equity_curve.push_back(config_.initial_balance);

    LOG_INFO("[Backtest] {} start - strategy {}, {} bars, lookback {}",
             symbol, strategy_->getName(), candles.size(), config_.lookback);

    for (size_t i = config_.lookback; i < candles.size(); ++i) {
        const int bar = static_cast<int>(i);
        const std::vector<Candle> window(candles.begin() + (i - config_.lookback),
                                         candles.begin() + i + 1);
        const std::vector<double> closes(all_closes.begin() + (i - config_.lookback),
                                         all_closes.begin() + i + 1);
        const double current_price = candles[i].close;

        const auto signal = strategy_->generateSignal(closes, &window);

        double avg_volume = 0.0;
        for (const auto& c : window) avg_volume += c.volume;
        avg_volume /= window.size();
        const double volatility = Statistics::stdDev(Statistics::simpleReturns(closes));

        if (signal.action == strategy::SignalAction::BUY &&
            signal.confidence > config_.min_confidence && !in_position) {
            const std::vector<double> history(all_closes.begin(), all_closes.begin() + i + 1);
            const auto sizing = sizer_->calculate(
                buildSizingRequest(history, portfolio.cash, current_price, signal.confidence, ledger));

            if (sizing.quantity > 0.0) {
                const FillContext context(sizing.quantity, avg_volume, volatility);
                double exec_price = current_price;
                double fee = 0.0;
                if (costs) {
                    exec_price = costs->getExecutionPrice(OrderSide::BUY, current_price, context);
                    fee = costs->getCommission(exec_price, sizing.quantity);
                }

                const double cost = exec_price * sizing.quantity + fee;
                if (cost <= portfolio.cash) {
                    portfolio.cash -= cost;
                    portfolio.positions[symbol] = Position{sizing.quantity, exec_price};

                    position.quantity = sizing.quantity;
                    position.entry_price = exec_price;
                    position.entry_fee = fee;
                    position.entry_bar = bar;
                    in_position = true;

                    Trade trade;
                    trade.symbol = symbol;
                    trade.side = OrderSide::BUY;
                    trade.quantity = sizing.quantity;
                    trade.price = current_price;
                    trade.realized_price = exec_price;
                    trade.fee = fee;
                    trade.bar_index = bar;
                    report.trades.push_back(trade);
                } else {
                    LOG_WARN("[Backtest] {} entry skipped at bar {}: cost {:.2f} exceeds cash {:.2f}",
                             symbol, bar, cost, portfolio.cash);
                }
            }
        } else if (signal.action == strategy::SignalAction::SELL && in_position) {
            closePosition(symbol, position, current_price,
                          FillContext(position.quantity, avg_volume, volatility),
                          bar, "signal", costs, portfolio, ledger, report);
            in_position = false;
        }

        const double holdings = in_position ? position.quantity * current_price : 0.0;
        report.equity_curve.push_back(portfolio.cash + holdings);
    }

    if (in_position) {
        const int last_bar = static_cast<int>(candles.size() - 1);
        closePosition(symbol, position, candles.back().close, FillContext(position.quantity),
                      last_bar, "end_of_data", costs, portfolio, ledger, report);
    }

    report.final_balance = portfolio.cash;
    if (costs) report.execution_costs = costs->report();
    PerformanceMetrics::fillReport(report, ledger.pnls, ledger.durations, config_.risk_free_rate);

    LOG_INFO("[Backtest] {} done - trades {}, pnl {:.2f} ({:.2f}%), sharpe {:.2f}, max DD {:.2f}%",
             symbol, report.total_trades, report.total_pnl, report.total_return,
             report.sharpe, report.max_drawdown);
    return report;
}

std::map<std::string, BacktestReport> BacktestEngine::runMultiple(
    const std::map<std::string, std::vector<Candle>>& histories) const {
    std::map<std::string, BacktestReport> results;
    for (const auto& [symbol, candles] : histories) {
        results[symbol] = run(symbol, candles);
    }
    return results;
}

} // namespace backtest
} // namespace quantcore
