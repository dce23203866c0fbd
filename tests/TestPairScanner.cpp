#include "analytics/PairScanner.h"
#include "TestHelpers.h"

#include <cassert>
#include <cmath>
#include <iostream>
#include <stdexcept>

using quantcore::analytics::PairCandidate;
using quantcore::analytics::PairScanner;
using quantcore::analytics::PairScannerConfig;
using quantcore::strategy::CointegrationResult;

namespace {

std::map<std::string, std::vector<double>> makeUniverse() {
    auto ab = testutil::cointegratedPair(250, 2.0, 0.5, 42);
    std::map<std::string, std::vector<double>> universe;
    universe["AAA"] = ab.first;
    universe["BBB"] = ab.second;
    universe["CCC"] = testutil::independentPair(250, 99).first;
    universe["DDD"] = testutil::independentPair(250, 5).second;
    return universe;
}

} // namespace

static void testFindsOnlyCointegratedPair() {
    PairScanner scanner;
    auto results = scanner.scan(makeUniverse());
    assert(results.size() == 1);

    const PairCandidate& best = results.front();
    assert(best.symbol_a == "AAA");
    assert(best.symbol_b == "BBB");
    assert(best.correlation > 0.95);
    assert(best.cointegration.is_cointegrated);
    assert(best.cointegration.is_stationary);
    assert(best.hedge_ratio > 0.0);
    assert(best.score > 0.5 && best.score <= 1.0);
    assert(testutil::near(best.score, scanner.compositeScore(best.cointegration)));
    std::cout << "[TEST] Scanner finds cointegrated pair PASSED\n";
}

static void testFiltersAndLimits() {
    PairScannerConfig strict;
    strict.min_score = 0.99;
    auto none = PairScanner(strict).scan(makeUniverse());
    assert(none.empty());

    // 빈 / 단일 종목 universe
    PairScanner scanner;
    assert(scanner.scan({}).empty());
    std::map<std::string, std::vector<double>> single{{"AAA", makeUniverse()["AAA"]}};
    assert(scanner.scan(single).empty());

    // 같은 페어 두 벌 -> max_results 로 잘림, 동점은 심볼 순
    auto universe = makeUniverse();
    universe["EEE"] = universe["AAA"];
    universe["FFF"] = universe["BBB"];
    PairScannerConfig limited;
    limited.max_results = 2;
    auto top = PairScanner(limited).scan(universe);
    assert(top.size() == 2);
    assert(top[0].score >= top[1].score);
    std::cout << "[TEST] Scanner filters / limits PASSED\n";
}

static void testCompositeScore() {
    PairScanner scanner;

    CointegrationResult perfect;
    perfect.adf_statistic = -5.0;
    perfect.hurst_exponent = 0.3;
    perfect.half_life_bars = 10.0;
    perfect.johansen_rank = 1;
    assert(testutil::near(scanner.compositeScore(perfect), 1.0));

    CointegrationResult partial;
    partial.adf_statistic = -2.5;      // 0.4 * 0.5
    partial.hurst_exponent = 0.7;      // 0
    partial.half_life_bars = 20.0;     // 0.2 / 2
    assert(testutil::near(scanner.compositeScore(partial), 0.3));

    assert(scanner.compositeScore(CointegrationResult()) == 0.0);
    std::cout << "[TEST] Scanner composite score PASSED\n";
}

static void testInvalidConfig() {
    PairScannerConfig bad;
    bad.max_results = 0;
    bool threw = false;
    try {
        PairScanner scanner(bad);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);
    std::cout << "[TEST] Scanner config validation PASSED\n";
}

int main() {
    testFindsOnlyCointegratedPair();
    testFiltersAndLimits();
    testCompositeScore();
    testInvalidConfig();
    std::cout << "[TEST] PairScanner PASSED\n";
    return 0;
}
