#include "execution/ExecutionModel.h"
#include "common/Logger.h"
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace quantcore {
namespace execution {

namespace {
constexpr double kBpsDivisor = 10000.0;
constexpr double kReferenceVolatility = 0.02;
}

const char* toString(SlippageModel model) {
    switch (model) {
        case SlippageModel::VOLUME: return "volume";
        case SlippageModel::VOLATILITY: return "volatility";
        default: return "fixed";
    }
}

std::optional<SlippageModel> parseSlippageModel(const std::string& name) {
    if (name == "fixed") return SlippageModel::FIXED;
    if (name == "volume") return SlippageModel::VOLUME;
    if (name == "volatility") return SlippageModel::VOLATILITY;
    return std::nullopt;
}

ExecutionModel::ExecutionModel(ExecutionConfig config)
    : config_(config)
    , total_slippage_(0.0)
    , total_commission_(0.0)
{
    if (!(config_.slippage_bps >= 0.0) || !(config_.commission_bps >= 0.0)) {
        throw std::invalid_argument("ExecutionModel: slippage_bps and commission_bps must be >= 0");
    }
    if (!(config_.market_impact_coeff >= 0.0)) {
        throw std::invalid_argument("ExecutionModel: market_impact_coeff must be >= 0");
    }

    LOG_INFO("ExecutionModel initialized - model {}, slippage {:.1f}bps, commission {:.1f}bps",
             toString(config_.slippage_model), config_.slippage_bps, config_.commission_bps);
}

double ExecutionModel::slippageFraction(const FillContext& context) const {
    const double base = config_.slippage_bps / kBpsDivisor;

    switch (config_.slippage_model) {
        case SlippageModel::VOLUME:
            // 평균 거래량을 모르면 고정 bps
            if (context.avg_volume > 0.0 && context.quantity > 0.0) {
                return config_.market_impact_coeff * std::sqrt(context.quantity / context.avg_volume);
            }
            return base;
        case SlippageModel::VOLATILITY:
            return base * std::max(1.0, context.volatility / kReferenceVolatility);
        case SlippageModel::FIXED:
            break;
    }
    return base;
}

double ExecutionModel::getExecutionPrice(OrderSide side, double price, const FillContext& context) {
    const double direction = (side == OrderSide::BUY) ? 1.0 : -1.0;
    const double slippage_amount = price * slippageFraction(context) * direction;

    total_slippage_ += std::abs(slippage_amount) * std::max(context.quantity, 0.0);
    return price + slippage_amount;
}

double ExecutionModel::getCommission(double price, double quantity) {
    const double commission = std::abs(price * quantity) * (config_.commission_bps / kBpsDivisor);
    total_commission_ += commission;
    return commission;
}

double ExecutionModel::roundTripCostBps() const {
    return (config_.slippage_bps + config_.commission_bps) * 2.0;
}

void ExecutionModel::reset() {
    total_slippage_ = 0.0;
    total_commission_ = 0.0;
}

ExecutionCostReport ExecutionModel::report() const {
    ExecutionCostReport r;
    r.total_slippage = total_slippage_;
    r.total_commission = total_commission_;
    r.total_costs = total_slippage_ + total_commission_;
    return r;
}

} // namespace execution
} // namespace quantcore
