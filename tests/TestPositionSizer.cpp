#include "risk/PositionSizer.h"
#include "TestHelpers.h"

#include <algorithm>
#include <cassert>
#include <cmath>
#include <iostream>
#include <optional>
#include <random>
#include <stdexcept>

using namespace quantcore::risk;
using quantcore::analytics::SizingRegime;
using testutil::near;

namespace {

std::vector<double> tailReturns() {
    std::vector<double> r(20, 0.01);
    r[3] = -0.05;
    r[11] = -0.08;
    return r;   // VaR95 = 0.05, CVaR95 = 0.065
}

std::vector<TradeRecord> mixedTrades(size_t wins, double win_pct, size_t losses, double loss_pct) {
    std::vector<TradeRecord> trades;
    for (size_t i = 0; i < wins; ++i) trades.emplace_back(win_pct);
    for (size_t i = 0; i < losses; ++i) trades.emplace_back(loss_pct);
    return trades;
}

SizingRequest baseRequest(double confidence) {
    SizingRequest req;
    req.portfolio_value = 100000.0;
    req.price = 100.0;
    req.confidence = confidence;
    return req;
}

} // namespace

static void testKellyFormulas() {
    PositionSizer sizer;
    // full = (0.6*0.1 - 0.4*0.05) / 0.1 = 0.4
    assert(near(sizer.kellySize(0.6, 0.1, 0.05), 0.4 * 0.33));
    assert(near(sizer.kellySize(0.6, 0.1, 0.05, 1.0), 0.25));   // max_yolo 로 clamp
    assert(sizer.kellySize(0.3, 0.05, 0.05) == 0.0);
    assert(sizer.kellySize(0.6, 0.0, 0.05) == 0.0);
    assert(sizer.kellySize(0.6, 0.1, 0.0) == 0.0);

    assert(PositionSizer::regimeKellyFraction(SizingRegime::BULL_LOW_VOL) == 0.50);
    assert(PositionSizer::regimeKellyFraction(SizingRegime::BEAR_HIGH_VOL) == 0.25);
    assert(PositionSizer::regimeKellyFraction(SizingRegime::RANGE_BOUND) == 0.40);
    assert(PositionSizer::regimeKellyFraction(SizingRegime::UNCERTAIN) == 0.20);
    assert(near(sizer.regimeAdjustedKelly(0.6, 0.1, 0.05, SizingRegime::BULL_LOW_VOL), 0.2));
    assert(near(sizer.regimeAdjustedKelly(0.6, 0.1, 0.05, SizingRegime::BEAR_HIGH_VOL), 0.1));
    std::cout << "[TEST] Kelly formulas PASSED\n";
}

static void testDrawdownAndAdaptive() {
    PositionSizer sizer;
    assert(near(sizer.drawdownAdjustedKelly(0.1, 0.075), 0.075));
    assert(near(sizer.drawdownAdjustedKelly(0.1, 0.30), 0.05));
    assert(sizer.drawdownAdjustedKelly(0.1, 0.0) == 0.1);

    assert(near(sizer.adaptiveKellyFraction(10), 0.20));        // 0.33 * 0.6 -> floor 0.2
    assert(near(sizer.adaptiveKellyFraction(35), 0.33 * 0.75));
    assert(near(sizer.adaptiveKellyFraction(200), 0.33));
    assert(near(sizer.adaptiveKellyFraction(200, SizingRegime::BULL_LOW_VOL), 0.50));
    assert(near(sizer.adaptiveKellyFraction(10, SizingRegime::BULL_LOW_VOL), 0.30));

    // 표본 수에 대해 단조 비감소, [0.20, base fraction] 범위
    const std::vector<std::optional<SizingRegime>> regimes{
        std::nullopt, SizingRegime::BULL_LOW_VOL, SizingRegime::BEAR_HIGH_VOL,
        SizingRegime::RANGE_BOUND, SizingRegime::UNCERTAIN};
    for (const auto& regime : regimes) {
        const double full = regime ? sizer.regimeKellyFraction(*regime) : 0.33;
        double previous = sizer.adaptiveKellyFraction(0, regime);
        for (size_t n = 0; n <= 200; ++n) {
            const double f = sizer.adaptiveKellyFraction(n, regime);
            assert(f >= previous - 1e-12);
            assert(f >= 0.20 - 1e-12);
            assert(f <= std::max(full, 0.20) + 1e-12);
            previous = f;
        }
        assert(near(previous, std::clamp(full, 0.20, 0.50)));
    }
    std::cout << "[TEST] Drawdown / adaptive fraction PASSED\n";
}

static void testTailRiskAndCost() {
    PositionSizer sizer;
    const auto returns = tailReturns();
    assert(near(sizer.varConstrainedKelly(0.5, returns, 0.02), 0.4));
    assert(near(sizer.varConstrainedKelly(0.2, returns, 0.02), 0.2));
    assert(near(sizer.cvarConstrainedKelly(0.5, returns, 0.03), 0.03 / 0.065));
    // CVaR >= VaR 이므로 같은 한도면 CVaR 쪽이 더 보수적
    assert(sizer.cvarConstrainedKelly(0.5, returns, 0.02) <= sizer.varConstrainedKelly(0.5, returns, 0.02));
    // 데이터 부족 -> 그대로
    assert(sizer.varConstrainedKelly(0.5, std::vector<double>(5, -0.1), 0.02) == 0.5);

    assert(near(sizer.costAdjustedKelly(0.1, 0.002, 0.05), 0.06));
    assert(sizer.costAdjustedKelly(0.01, 0.01, 0.05) == 0.0);
    std::cout << "[TEST] VaR / CVaR / cost constraints PASSED\n";
}

static void testEstimators() {
    PositionSizer sizer;
    auto trades = mixedTrades(8, 0.03, 4, -0.02);
    auto rolling = sizer.rollingKellyEstimate(trades);
    assert(rolling);
    assert(near(rolling->win_rate, 8.0 / 12.0));
    assert(near(rolling->avg_win, 0.03));
    assert(near(rolling->avg_loss, 0.02));
    assert(near(rolling->kelly_pct, (8.0 / 12.0 * 0.03 - 4.0 / 12.0 * 0.02) / 0.03 * 0.33));
    assert(!sizer.rollingKellyEstimate(mixedTrades(5, 0.03, 4, -0.02)));
    assert(!sizer.rollingKellyEstimate(mixedTrades(12, 0.03, 0, 0.0)));

    // 최근 거래가 승리 위주면 지수가중 승률이 단순 승률보다 높다
    auto recent_wins = mixedTrades(0, 0.0, 10, -0.02);
    for (int i = 0; i < 10; ++i) recent_wins.emplace_back(0.03);
    auto expo = sizer.exponentialKellyEstimate(recent_wins, 5.0);
    assert(expo);
    assert(expo->win_rate > 0.5);
    assert(expo->sample_size < 20.0);
    assert(!sizer.exponentialKellyEstimate(recent_wins, 0.0));

    // TWR = (1+2f)^6 (1-f)^4 -> f* = 0.4
    auto of = sizer.optimalF(mixedTrades(6, 0.10, 4, -0.05));
    assert(of);
    assert(near(of->optimal_f, 0.40));
    assert(near(of->worst_loss, -0.05));
    assert(near(of->position_pct, 0.40 * 0.05 * 0.33));
    assert(of->terminal_wealth > 1.0);
    assert(!sizer.optimalF(mixedTrades(10, 0.1, 0, 0.0)));
    std::cout << "[TEST] Kelly estimators PASSED\n";
}

static void testBootstrapInterval() {
    PositionSizer sizer;
    auto trades = mixedTrades(12, 0.03, 8, -0.02);
    std::mt19937_64 rng_a(42), rng_b(42);
    auto ci = sizer.kellyConfidenceInterval(trades, rng_a);
    auto again = sizer.kellyConfidenceInterval(trades, rng_b);
    assert(ci && again);
    assert(ci->resamples == 1000);
    assert(ci->lower <= ci->median && ci->median <= ci->upper);
    assert(near(ci->spread, ci->upper - ci->lower));
    assert(ci->lower == again->lower && ci->upper == again->upper);

    std::mt19937_64 rng(1);
    assert(!sizer.kellyConfidenceInterval(mixedTrades(8, 0.03, 6, -0.02), rng));
    assert(!sizer.kellyConfidenceInterval(trades, rng, 0));
    std::cout << "[TEST] Kelly bootstrap interval PASSED\n";
}

static void testStrategyAndPortfolio() {
    PositionSizer sizer;
    // momentum 기본값: p 0.55, R 2.0 -> full 0.325
    assert(near(sizer.strategyKellySize("momentum", std::nullopt, {}), 0.325 * 0.33));
    assert(near(sizer.strategyKellySize("pairs_trading", std::nullopt, {}), 0.25 * 0.33));
    assert(near(sizer.strategyKellySize("pairs_trading", SizingRegime::BULL_LOW_VOL, {}), 0.125));
    assert(sizer.strategyKellySize("unknown", std::nullopt, {}) == 0.0);
    // 이력 10건 이상이면 기본값 대신 rolling 추정
    auto trades = mixedTrades(8, 0.03, 4, -0.02);
    assert(near(sizer.strategyKellySize("momentum", std::nullopt, trades),
                sizer.rollingKellyEstimate(trades)->kelly_pct));

    std::vector<double> r1{0.01, -0.02, 0.015, 0.005, -0.01, 0.02};
    std::vector<PortfolioPosition> same{{"a", 0.2, r1}, {"b", 0.1, r1}};
    auto alloc = sizer.portfolioKelly(same);
    assert(alloc.size() == 2);
    assert(near(alloc[0].avg_abs_correlation, 1.0));
    assert(near(alloc[0].diversification_factor, 1.0 / std::sqrt(2.0)));
    assert(near(alloc[0].adjusted_pct, 0.2 / std::sqrt(2.0)));

    std::vector<PortfolioPosition> solo{{"a", -0.1, r1}};
    auto one = sizer.portfolioKelly(solo);
    assert(one[0].diversification_factor == 1.0);
    assert(one[0].adjusted_pct == 0.0);

    auto weights = PositionSizer::riskParityWeights({{"a", 0.1}, {"b", 0.2}, {"c", 0.0}});
    assert(weights.size() == 2);
    assert(near(weights["a"], 2.0 / 3.0));
    assert(near(weights["b"], 1.0 / 3.0));
    assert(PositionSizer::riskParityWeights({{"x", -1.0}}).empty());
    std::cout << "[TEST] Strategy Kelly / portfolio PASSED\n";
}

static void testCalculatePipeline() {
    PositionSizer sizer;

    auto standard = sizer.calculate(baseRequest(0.5));
    assert(standard.method == "standard");
    assert(standard.quantity == 50.0);
    assert(near(standard.position_pct, 5.0));

    auto yolo = sizer.calculate(baseRequest(0.9));
    assert(yolo.method == "yolo");
    assert(yolo.quantity == 225.0);

    auto bad = baseRequest(0.5);
    bad.price = 0.0;
    auto none = sizer.calculate(bad);
    assert(none.method == "none" && none.isSkipped());

    auto small = baseRequest(0.5);
    small.portfolio_value = 1000.0;
    auto skipped = sizer.calculate(small);
    assert(skipped.method == "skip");
    assert(skipped.isSkipped());
    assert(skipped.reason.find("below minimum") != std::string::npos);

    auto pricey = baseRequest(0.5);
    pricey.price = 1e6;
    auto fractional = sizer.calculate(pricey);
    assert(near(fractional.quantity, 0.005));

    auto req = baseRequest(1.0);
    req.win_rate = 0.6;
    req.avg_win_return = 0.1;
    req.avg_loss_return = 0.05;
    auto kelly = sizer.calculate(req);
    assert(kelly.method == "kelly");
    assert(near(kelly.position_pct, 13.2));
    assert(kelly.quantity >= 131.0 && kelly.quantity <= 132.0);   // floor 반올림 오차

    req.regime = SizingRegime::BULL_LOW_VOL;   // 0.2
    req.current_drawdown = 0.075;              // x0.75 -> 0.15
    req.returns = tailReturns();
    req.use_cvar_constraint = true;            // 0.15 * 0.065 < 0.03
    req.use_var_constraint = true;
    req.transaction_cost_pct = 0.002;          // -0.002 / 0.1 -> 0.13
    req.volatility = 0.04;                     // x0.5 -> 0.065
    auto full = sizer.calculate(req);
    assert(full.method == "kelly+regime+dd_adjusted+cvar+cost_adj+vol_adjusted");
    assert(near(full.position_pct, 6.5, 1e-9));
    assert(full.quantity >= 64.0 && full.quantity <= 65.0);

    auto losing = baseRequest(0.5);
    losing.win_rate = 0.3;
    losing.avg_win_return = 0.05;
    losing.avg_loss_return = 0.05;
    assert(sizer.calculate(losing).method == "standard");
    // 음수 edge 는 전략 기본값으로 넘어가지 않고 standard 로 떨어진다
    losing.strategy_name = "momentum";
    const auto losing_named = sizer.calculate(losing);
    assert(losing_named.method == "standard");
    assert(losing_named.quantity == 50.0);

    auto named = baseRequest(1.0);
    named.strategy_name = "momentum";
    auto by_name = sizer.calculate(named);
    assert(by_name.method == "kelly+strategy");
    assert(near(by_name.position_pct, 0.325 * 0.33 * 100.0));

    auto adaptive = req;
    adaptive.regime.reset();
    adaptive.current_drawdown.reset();
    adaptive.returns.clear();
    adaptive.transaction_cost_pct.reset();
    adaptive.volatility.reset();
    adaptive.trades = mixedTrades(6, 0.03, 4, -0.02);
    adaptive.use_adaptive_fraction = true;
    auto adapted = sizer.calculate(adaptive);
    assert(adapted.method == "kelly+adaptive");
    assert(near(adapted.position_pct, 0.4 * 0.20 * 100.0));

    auto expo = baseRequest(1.0);
    expo.strategy_name = "momentum";
    expo.use_exponential_weighting = true;
    expo.trades = mixedTrades(8, 0.03, 4, -0.02);
    assert(sizer.calculate(expo).method == "kelly+exp_weighted");
    std::cout << "[TEST] Sizing pipeline PASSED\n";
}

static void testConfigValidation() {
    PositionSizerConfig bad;
    bad.kelly_fraction = 0.0;
    bool threw = false;
    try {
        PositionSizer sizer(bad);
    } catch (const std::invalid_argument& e) {
        threw = std::string(e.what()).find("kelly_fraction") != std::string::npos;
    }
    assert(threw);

    bad = PositionSizerConfig();
    bad.max_yolo_pct = 0.05;   // max_position_pct 보다 작음
    threw = false;
    try {
        PositionSizer sizer(bad);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);
    std::cout << "[TEST] Sizer config validation PASSED\n";
}

int main() {
    testKellyFormulas();
    testDrawdownAndAdaptive();
    testTailRiskAndCost();
    testEstimators();
    testBootstrapInterval();
    testStrategyAndPortfolio();
    testCalculatePipeline();
    testConfigValidation();
    std::cout << "[TEST] PositionSizer PASSED\n";
    return 0;
}
