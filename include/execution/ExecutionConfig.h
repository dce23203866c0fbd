#pragma once

#include <optional>
#include <string>

namespace quantcore {
namespace execution {

enum class SlippageModel {
    FIXED,       // slippage_bps 고정
    VOLUME,      // market impact: coeff * sqrt(qty / avg_volume)
    VOLATILITY   // slippage_bps * max(1, vol / 0.02)
};

const char* toString(SlippageModel model);
std::optional<SlippageModel> parseSlippageModel(const std::string& name);

struct ExecutionConfig {
    double slippage_bps = 5.0;
    double commission_bps = 10.0;
    SlippageModel slippage_model = SlippageModel::FIXED;
    double market_impact_coeff = 0.1;
};

} // namespace execution
} // namespace quantcore
