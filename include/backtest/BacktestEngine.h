#pragma once

#include "common/Types.h"
#include "backtest/BacktestConfig.h"
#include "backtest/BacktestReport.h"
#include "strategy/IStrategy.h"
#include "risk/PositionSizer.h"
#include "execution/ExecutionModel.h"
#include "analytics/RegimeDetector.h"
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace quantcore {
namespace backtest {

// 단일 자산 bar-by-bar 백테스트 (long-only)
// signal -> PositionSizer -> ExecutionModel -> ledger -> equity curve
class BacktestEngine {
public:
    // execution 이 nullptr 이면 비용 없이 종가 체결
    BacktestEngine(std::shared_ptr<strategy::IStrategy> strategy,
                   std::shared_ptr<risk::PositionSizer> sizer,
                   std::shared_ptr<execution::ExecutionModel> execution = nullptr,
                   BacktestConfig config = BacktestConfig());

    // run 간 공유 상태 없음. ExecutionModel 은 run 마다 복사본을 쓴다
    BacktestReport run(const std::string& symbol, const std::vector<Candle>& candles) const;

    std::map<std::string, BacktestReport> runMultiple(
        const std::map<std::string, std::vector<Candle>>& histories) const;

    const BacktestConfig& config() const { return config_; }

private:
    struct OpenPosition {
        double quantity = 0.0;
        double entry_price = 0.0;   // realized
        double entry_fee = 0.0;
        int entry_bar = 0;
    };

    // 한 run 의 청산 거래 (rolling Kelly 입력)
    struct RunLedger {
        std::vector<risk::TradeRecord> trades;
        std::vector<double> pnls;
        std::vector<int> durations;
    };

    risk::SizingRequest buildSizingRequest(const std::vector<double>& history_closes,
                                           double portfolio_value, double price,
                                           double confidence,
                                           const RunLedger& ledger) const;

    static void closePosition(const std::string& symbol, OpenPosition& position, double price,
                              const execution::FillContext& context, int bar,
                              const std::string& exit_reason, execution::ExecutionModel* costs,
                              Portfolio& portfolio, RunLedger& ledger, BacktestReport& report);

    std::shared_ptr<strategy::IStrategy> strategy_;
    std::shared_ptr<risk::PositionSizer> sizer_;
    std::shared_ptr<const execution::ExecutionModel> execution_;  // run 별 복사 원본
    BacktestConfig config_;
    analytics::RegimeDetector regime_detector_;
};

} // namespace backtest
} // namespace quantcore
