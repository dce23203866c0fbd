#pragma once

#include "common/Types.h"
#include <string>
#include <vector>
#include <optional>

namespace quantcore {
namespace strategy {

enum class SignalAction {
    BUY,
    SELL,
    HOLD
};

inline const char* toString(SignalAction action) {
    switch (action) {
        case SignalAction::BUY: return "BUY";
        case SignalAction::SELL: return "SELL";
        default: return "HOLD";
    }
}

// 전략 신호. 같은 입력이면 항상 같은 결과 (결정적)
struct Signal {
    SignalAction action;
    double strength;                    // -1.0 (short) ~ +1.0 (long)
    double confidence;                  // 0.0 ~ 1.0
    std::optional<double> z_score;
    std::optional<double> hedge_ratio;  // pairs only
    std::vector<std::string> reasons;

    Signal()
        : action(SignalAction::HOLD)
        , strength(0.0)
        , confidence(0.0)
    {}

    // +1 / -1 / 0
    int direction() const {
        return strength > 0.0 ? 1 : (strength < 0.0 ? -1 : 0);
    }

    static Signal hold(const std::string& reason) {
        Signal s;
        s.reasons.push_back(reason);
        return s;
    }
};

inline bool operator==(const Signal& lhs, const Signal& rhs) {
    return lhs.action == rhs.action
        && lhs.strength == rhs.strength
        && lhs.confidence == rhs.confidence
        && lhs.z_score == rhs.z_score
        && lhs.hedge_ratio == rhs.hedge_ratio
        && lhs.reasons == rhs.reasons;
}

inline bool operator!=(const Signal& lhs, const Signal& rhs) {
    return !(lhs == rhs);
}

// 단일 자산 전략 인터페이스 (Backtest Engine 이 의존)
class IStrategy {
public:
    virtual ~IStrategy() = default;

    virtual std::string getName() const = 0;

    // candles 는 선택 (거래량 등 OHLCV 가 필요한 전략용)
    virtual Signal generateSignal(const std::vector<double>& closes,
                                  const std::vector<Candle>* candles = nullptr) const = 0;
};

// 두 자산 스프레드 전략 인터페이스 (Pairs Backtest Engine 이 의존)
class IPairStrategy {
public:
    virtual ~IPairStrategy() = default;

    virtual std::string getName() const = 0;

    virtual Signal generateSignal(const std::vector<double>& closes_a,
                                  const std::vector<double>& closes_b) const = 0;
};

} // namespace strategy
} // namespace quantcore
