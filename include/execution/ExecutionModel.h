#pragma once

#include "common/Types.h"
#include "execution/ExecutionConfig.h"

namespace quantcore {
namespace execution {

// 체결 시점 시장 상태 (모델별로 필요한 값만 사용)
struct FillContext {
    double quantity = 0.0;
    double avg_volume = 0.0;
    double volatility = 0.0;

    FillContext() = default;
    FillContext(double qty, double avg_vol = 0.0, double vol = 0.0)
        : quantity(qty), avg_volume(avg_vol), volatility(vol) {}
};

struct ExecutionCostReport {
    double total_slippage = 0.0;
    double total_commission = 0.0;
    double total_costs = 0.0;
};

// 슬리피지 + 수수료 모델. 누적 비용은 백테스트 1회 단위로 reset()
class ExecutionModel {
public:
    explicit ExecutionModel(ExecutionConfig config = ExecutionConfig());

    // BUY 는 더 비싸게, SELL 은 더 싸게 체결. 슬리피지 금액을 누적한다
    double getExecutionPrice(OrderSide side, double price, const FillContext& context);

    // notional * commission_bps. 수수료를 누적한다
    double getCommission(double price, double quantity);

    // (slippage + commission) * 2
    double roundTripCostBps() const;

    void reset();
    ExecutionCostReport report() const;

    double totalSlippage() const { return total_slippage_; }
    double totalCommission() const { return total_commission_; }
    const ExecutionConfig& config() const { return config_; }

private:
    double slippageFraction(const FillContext& context) const;

    ExecutionConfig config_;
    double total_slippage_;
    double total_commission_;
};

} // namespace execution
} // namespace quantcore
