#pragma once

#include "backtest/BacktestConfig.h"
#include "backtest/BacktestReport.h"
#include "strategy/IStrategy.h"
#include "risk/PositionSizer.h"
#include "execution/ExecutionModel.h"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace quantcore {
namespace backtest {

// 두 자산 스프레드 백테스트
// long spread = buy A / sell B, short spread = sell A / buy B
class PairsBacktestEngine {
public:
    PairsBacktestEngine(std::shared_ptr<strategy::IPairStrategy> strategy,
                        std::shared_ptr<risk::PositionSizer> sizer,
                        std::shared_ptr<execution::ExecutionModel> execution = nullptr,
                        BacktestConfig config = BacktestConfig());

    // run 간 공유 상태 없음. ExecutionModel 은 run 마다 복사본을 쓴다
    PairsBacktestReport run(const std::vector<double>& closes_a,
                            const std::vector<double>& closes_b,
                            const std::string& symbol_a = "A",
                            const std::string& symbol_b = "B") const;

    const BacktestConfig& config() const { return config_; }

private:
    struct SpreadPosition {
        int direction = 0;
        double hedge_ratio = 0.0;
        double quantity_a = 0.0;
        double quantity_b = 0.0;
        double entry_price_a = 0.0;     // realized
        double entry_price_b = 0.0;
        double entry_fees = 0.0;
        int entry_bar = 0;
    };

    std::optional<SpreadPosition> openPosition(const strategy::Signal& signal,
                                               double price_a, double price_b,
                                               double cash, int bar,
                                               execution::ExecutionModel* costs) const;

    // 실현 손익(청산 수수료 차감)을 cash 에 반영
    PairTrade closePosition(const SpreadPosition& position, double price_a, double price_b,
                            int bar, const std::string& exit_reason, const std::string& pair_label,
                            execution::ExecutionModel* costs, double& cash) const;

    static double markToMarket(const SpreadPosition& position, double price_a, double price_b);

    std::shared_ptr<strategy::IPairStrategy> strategy_;
    std::shared_ptr<risk::PositionSizer> sizer_;
    std::shared_ptr<const execution::ExecutionModel> execution_;  // run 별 복사 원본
    BacktestConfig config_;
};

} // namespace backtest
} // namespace quantcore
