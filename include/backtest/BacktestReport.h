#pragma once

#include "common/Types.h"
#include "execution/ExecutionModel.h"
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace quantcore {
namespace backtest {

// 백테스트 공통 성과 요약. *_pct 가 아닌 비율 필드는 퍼센트 단위로 보고한다
struct PerformanceReport {
    double initial_balance = 0.0;
    double final_balance = 0.0;
    double total_pnl = 0.0;
    double total_return = 0.0;      // %
    int total_trades = 0;           // completed round trips
    int wins = 0;
    int losses = 0;
    double win_rate = 0.0;          // %
    double avg_win = 0.0;
    double avg_loss = 0.0;          // positive
    double profit_factor = 0.0;
    double max_drawdown = 0.0;      // %
    double sharpe = 0.0;
    double sortino = 0.0;
    double calmar = 0.0;
    double avg_duration_bars = 0.0;
    std::map<std::string, int> exit_reasons;
    std::optional<execution::ExecutionCostReport> execution_costs;
    std::vector<double> equity_curve;
    std::string error;              // 실행 불가 시에만 설정

    bool ok() const { return error.empty(); }
};

struct BacktestReport : PerformanceReport {
    std::string symbol;
    std::vector<Trade> trades;      // entry + exit fills
};

// 스프레드 포지션 1건 (진입 ~ 청산)
struct PairTrade {
    int direction = 0;              // +1 long spread, -1 short spread
    int entry_bar = 0;
    int exit_bar = 0;
    int duration_bars = 0;
    double hedge_ratio = 0.0;
    double quantity_a = 0.0;
    double quantity_b = 0.0;
    double entry_price_a = 0.0;
    double entry_price_b = 0.0;
    double exit_price_a = 0.0;
    double exit_price_b = 0.0;
    double fees = 0.0;
    double pnl = 0.0;
    double pnl_pct = 0.0;           // % of initial balance
    std::string exit_reason;
};

struct PairsBacktestReport : PerformanceReport {
    std::string symbol_a;
    std::string symbol_b;
    size_t data_points = 0;
    std::vector<PairTrade> trades;
};

} // namespace backtest
} // namespace quantcore
