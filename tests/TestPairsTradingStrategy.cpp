#include "strategy/PairsTradingStrategy.h"
#include "TestHelpers.h"

#include <cassert>
#include <cmath>
#include <iostream>
#include <stdexcept>

using namespace quantcore::strategy;

namespace {

// A = 1.5 * B + AR(0.5) 스프레드, 마지막 스프레드 값만 교체
testutil::PricePair spreadWithLastValue(double last) {
    auto b = testutil::randomWalk(200, 11, 50.0);
    auto s = testutil::ar1(200, 0.5, 7);
    s.back() = last;
    std::vector<double> a;
    for (size_t i = 0; i < b.size(); ++i) a.push_back(1.5 * b[i] + s[i]);
    return {a, b};
}

bool hasReasonContaining(const Signal& s, const std::string& text) {
    for (const auto& r : s.reasons) {
        if (r.find(text) != std::string::npos) return true;
    }
    return false;
}

} // namespace

static void testLongSpreadEntry() {
    PairsTradingStrategy strategy;
    auto data = spreadWithLastValue(-1.0);
    auto analysis = strategy.analyze(data.first, data.second);
    const Signal& s = analysis.signal;

    assert(s.action == SignalAction::BUY);
    assert(s.direction() == 1);
    assert(s.z_score && *s.z_score < -2.0 && *s.z_score > -3.5);
    assert(s.hedge_ratio && std::abs(*s.hedge_ratio - 1.5) < 0.1);
    assert(s.confidence > 0.5 && s.confidence <= 0.95);

    assert(analysis.cointegration);
    assert(analysis.cointegration->is_stationary);
    assert(analysis.cointegration->is_cointegrated);
    assert(analysis.cointegration->hurst_exponent && *analysis.cointegration->hurst_exponent < 0.5);
    assert(analysis.cointegration->half_life_bars);
    assert(analysis.kalman_beta);
    assert(analysis.spread && analysis.spread->values.size() == 200);
    std::cout << "[TEST] Pairs long spread entry PASSED\n";
}

static void testShortSpreadEntry() {
    PairsTradingStrategy strategy;
    auto data = spreadWithLastValue(1.0);
    auto s = strategy.generateSignal(data.first, data.second);
    assert(s.action == SignalAction::SELL);
    assert(s.direction() == -1);
    assert(*s.z_score > 2.0);
    assert(hasReasonContaining(s, "short spread"));
    std::cout << "[TEST] Pairs short spread entry PASSED\n";
}

static void testStopExitAndNoTradeZone() {
    PairsTradingStrategy strategy;

    auto stop = strategy.generateSignal(spreadWithLastValue(-2.0).first, spreadWithLastValue(-2.0).second);
    assert(stop.direction() == 0);
    assert(stop.confidence == 0.0);
    assert(std::abs(*stop.z_score) >= 3.5);
    assert(hasReasonContaining(stop, "beyond stop"));

    auto data = spreadWithLastValue(0.0);
    auto exit = strategy.generateSignal(data.first, data.second);
    assert(exit.direction() == 0);
    assert(std::abs(*exit.z_score) <= 0.5);
    assert(hasReasonContaining(exit, "exit"));

    data = spreadWithLastValue(0.5);
    auto zone = strategy.generateSignal(data.first, data.second);
    assert(zone.direction() == 0);
    assert(hasReasonContaining(zone, "no-trade zone"));
    // 진입 전 구간 confidence = |z| / entry * 0.3
    assert(std::abs(zone.confidence - std::abs(*zone.z_score) / 2.0 * 0.3) < 1e-9);
    std::cout << "[TEST] Pairs stop / exit / no-trade zone PASSED\n";
}

static void testNonStationarySpreadIsFlat() {
    PairsTradingStrategy strategy;
    auto b = testutil::randomWalk(200, 11, 50.0);
    auto s = testutil::randomWalk(200, 21);
    std::vector<double> a;
    for (size_t i = 0; i < b.size(); ++i) a.push_back(1.5 * b[i] + s[i]);

    auto analysis = strategy.analyze(a, b);
    assert(analysis.signal.direction() == 0);
    assert(analysis.signal.action == SignalAction::HOLD);
    assert(!analysis.signal.z_score);
    assert(analysis.signal.hedge_ratio);
    assert(!analysis.cointegration->is_stationary);
    assert(hasReasonContaining(analysis.signal, "not stationary"));
    std::cout << "[TEST] Pairs non-stationary gate PASSED\n";
}

static void testInsufficientData() {
    PairsTradingStrategy strategy;
    std::vector<double> a(59, 100.0), b(59, 50.0);
    auto s = strategy.generateSignal(a, b);
    assert(s.action == SignalAction::HOLD);
    assert(s.reasons.size() == 1);
    assert(hasReasonContaining(s, "Insufficient data"));

    // 상수 B -> 회귀 실패
    std::vector<double> ramp;
    for (int i = 0; i < 80; ++i) ramp.push_back(100.0 + i);
    auto flat = strategy.generateSignal(ramp, std::vector<double>(80, 50.0));
    assert(flat.direction() == 0);
    assert(hasReasonContaining(flat, "degenerate"));
    std::cout << "[TEST] Pairs insufficient / degenerate data PASSED\n";
}

static void testDeterminism() {
    PairsTradingStrategy strategy;
    auto data = spreadWithLastValue(-1.0);
    auto first = strategy.generateSignal(data.first, data.second);
    auto second = strategy.generateSignal(data.first, data.second);
    assert(first == second);

    PairsTradingConfig kcfg;
    kcfg.use_kalman = true;
    PairsTradingStrategy kalman_strategy(kcfg);
    auto k1 = kalman_strategy.analyze(data.first, data.second);
    auto k2 = kalman_strategy.analyze(data.first, data.second);
    assert(k1.signal == k2.signal);
    assert(k1.spread->intercept == 0.0);
    assert(*k1.kalman_beta == k1.spread->hedge_ratio);
    std::cout << "[TEST] Pairs determinism PASSED\n";
}

static void testPositionLegs() {
    auto legs = PairsTradingStrategy::getPositionLegs(10000.0, 100.0, 50.0, -1.5);
    assert(testutil::near(legs.hedge_ratio, 1.5));
    // unit = 100 + 1.5 * 50 = 175
    assert(testutil::near(legs.quantity_a, 10000.0 / 175.0));
    assert(testutil::near(legs.quantity_b, legs.quantity_a * 1.5));
    assert(testutil::near(legs.quantity_a * 100.0 + legs.quantity_b * 50.0, 10000.0, 1e-6));

    auto none = PairsTradingStrategy::getPositionLegs(0.0, 100.0, 50.0, 1.5);
    assert(none.quantity_a == 0.0 && none.quantity_b == 0.0);
    std::cout << "[TEST] Pairs position legs PASSED\n";
}

static void testConfigValidation() {
    PairsTradingConfig bad;
    bad.entry_z_score = 0.4;   // exit 0.5 보다 작음
    bool threw = false;
    try {
        PairsTradingStrategy s(bad);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);

    bad = PairsTradingConfig();
    bad.stop_z_score = 1.0;
    threw = false;
    try {
        PairsTradingStrategy s(bad);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);

    // Kalman 을 쓰지 않아도 noise 파라미터는 생성 시점에 검증
    bad = PairsTradingConfig();
    bad.use_kalman = false;
    bad.kalman_delta = 0.0;
    threw = false;
    try {
        PairsTradingStrategy s(bad);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);

    // 유효한 설정은 generateSignal 에서 예외를 던지지 않는다
    PairsTradingConfig plain;
    plain.use_kalman = false;
    PairsTradingStrategy strategy(plain);
    const auto data = testutil::cointegratedPair(120);
    const Signal signal = strategy.generateSignal(data.first, data.second);
    assert(signal.confidence >= 0.0 && signal.confidence <= 1.0);
    std::cout << "[TEST] Pairs config validation PASSED\n";
}

int main() {
    testLongSpreadEntry();
    testShortSpreadEntry();
    testStopExitAndNoTradeZone();
    testNonStationarySpreadIsFlat();
    testInsufficientData();
    testDeterminism();
    testPositionLegs();
    testConfigValidation();
    std::cout << "[TEST] PairsTradingStrategy PASSED\n";
    return 0;
}
