#include "analytics/Statistics.h"
#include "TestHelpers.h"

#include <cassert>
#include <cmath>
#include <iostream>

using quantcore::analytics::Statistics;
using quantcore::analytics::VaRMethod;
using testutil::near;

static void testBasics() {
    std::vector<double> v{2.0, 4.0, 4.0, 4.0, 5.0, 5.0, 7.0, 9.0};
    assert(near(Statistics::mean(v), 5.0));
    assert(near(Statistics::stdDev(v), 2.0));  // population
    assert(Statistics::mean({}) == 0.0);

    auto d = Statistics::differences({1.0, 3.0, 6.0});
    assert(d.size() == 2 && near(d[0], 2.0) && near(d[1], 3.0));

    auto r = Statistics::simpleReturns({100.0, 110.0, 99.0});
    assert(near(r[0], 0.10) && near(r[1], -0.10));
    std::cout << "[TEST] Statistics basics PASSED\n";
}

static void testOls() {
    std::vector<double> x, y;
    for (int i = 0; i < 50; ++i) {
        x.push_back(i);
        y.push_back(2.0 * i + 1.0);
    }
    auto fit = Statistics::ols(y, x);
    assert(fit);
    assert(near(fit->beta, 2.0, 1e-9));
    assert(near(fit->alpha, 1.0, 1e-9));
    assert(near(fit->r_squared, 1.0, 1e-9));
    assert(fit->residuals.size() == 50);

    // 상수 회귀변수, 길이 불일치, 너무 짧은 입력
    assert(!Statistics::ols(y, std::vector<double>(50, 3.0)));
    assert(!Statistics::ols({1.0, 2.0, 3.0}, {1.0, 2.0}));
    assert(!Statistics::ols({1.0, 2.0}, {1.0, 2.0}));
    std::cout << "[TEST] OLS PASSED\n";
}

static void testAdf() {
    auto stationary = testutil::ar1(200, 0.5, 7);
    auto adf = Statistics::adfTest(stationary);
    assert(adf);
    assert(adf->is_stationary);
    assert(adf->statistic < -3.51);
    assert(adf->p_value == 0.01);

    auto walk = testutil::randomWalk(200, 21);
    auto rw = Statistics::adfTest(walk);
    assert(rw);
    assert(!rw->is_stationary);
    assert(rw->p_value > 0.05);

    assert(!Statistics::adfTest(std::vector<double>(19, 1.0)));
    // 상수 시계열: lagged 분산 0
    assert(!Statistics::adfTest(std::vector<double>(50, 1.0)));

    assert(Statistics::adfPValue(-4.0) == 0.01);
    assert(Statistics::adfPValue(-3.0) == 0.05);
    assert(Statistics::adfPValue(-2.6) == 0.10);
    assert(Statistics::adfPValue(-2.0) == 0.30);
    assert(Statistics::adfPValue(-1.0) == 0.50);
    std::cout << "[TEST] ADF PASSED\n";
}

static void testHurstAndHalfLife() {
    auto ar = testutil::ar1(200, 0.5, 7);
    auto anti = Statistics::hurstExponent(Statistics::differences(ar));
    assert(anti);
    assert(*anti < 0.5);

    // 지속성 증분 (EMA 형태)
    testutil::Lcg rng(5);
    std::vector<double> persistent;
    double m = 0.0;
    for (int i = 0; i < 200; ++i) {
        m = 0.95 * m + rng.next();
        persistent.push_back(m);
    }
    auto trending = Statistics::hurstExponent(persistent);
    assert(trending);
    assert(*trending > 0.6);
    assert(*trending > *anti);

    assert(!Statistics::hurstExponent(std::vector<double>(39, 1.0)));
    assert(!Statistics::hurstExponent(persistent, 8));

    auto hl = Statistics::halfLife(ar);
    assert(hl);
    assert(*hl > 0.5 && *hl < 2.0);

    // 발산 시계열은 반감기 없음
    std::vector<double> explosive;
    double v = 1.0;
    for (int i = 0; i < 50; ++i) {
        v *= 1.05;
        explosive.push_back(v);
    }
    assert(!Statistics::halfLife(explosive));
    std::cout << "[TEST] Hurst / half-life PASSED\n";
}

static void testZScore() {
    std::vector<double> flat(30, 5.0);
    auto z0 = Statistics::zScore(flat, 20);
    assert(z0 && *z0 == 0.0);

    std::vector<double> s(19, 0.0);
    s.push_back(10.0);
    auto z = Statistics::zScore(s, 20);
    assert(z);
    // mean 0.5, sd = sqrt(4.75)
    assert(near(*z, 9.5 / std::sqrt(4.75), 1e-9));

    assert(!Statistics::zScore(s, 21));
    assert(!Statistics::zScore(s, 0));
    std::cout << "[TEST] Z-score PASSED\n";
}

static void testJohansen() {
    auto pair = testutil::cointegratedPair(300, 3.0, 0.5, 42);
    auto coint = Statistics::johansenTest(pair.first, pair.second);
    assert(coint.rank >= 1);
    assert(coint.trace_stat_r0 > Statistics::kTraceCritical5[0]);
    assert(coint.eigenvalue_1 >= coint.eigenvalue_2);
    assert(coint.observations == 299);
    assert(coint.reason.empty());
    // max-eigenvalue 검정도 같은 결론, 임계값과 일관
    assert(coint.max_eigen_rank >= 1);
    assert(coint.max_eigen_stat_r0 > Statistics::kMaxEigenCritical5[0]);
    assert((coint.max_eigen_rank == 2) == (coint.max_eigen_stat_r1 > Statistics::kMaxEigenCritical5[1]));

    auto small = Statistics::johansenTest(std::vector<double>(30, 1.0), std::vector<double>(30, 2.0));
    assert(small.rank == 0 && small.max_eigen_rank == 0);
    assert(!small.reason.empty());

    // 상수 시계열 -> 특이행렬
    std::vector<double> ramp;
    for (int i = 0; i < 60; ++i) ramp.push_back(i);
    auto singular = Statistics::johansenTest(ramp, std::vector<double>(60, 5.0));
    assert(singular.rank == 0 && singular.max_eigen_rank == 0);
    assert(!singular.reason.empty());
    std::cout << "[TEST] Johansen PASSED\n";
}

static void testCorrelationAndTailRisk() {
    std::vector<double> x{1, 2, 3, 4, 5, 6};
    std::vector<double> y{2, 4, 6, 8, 10, 12};
    std::vector<double> neg{6, 5, 4, 3, 2, 1};
    assert(near(*Statistics::pearsonCorrelation(x, y), 1.0, 1e-12));
    assert(near(*Statistics::pearsonCorrelation(x, neg), -1.0, 1e-12));
    assert(!Statistics::pearsonCorrelation(x, std::vector<double>(6, 3.0)));
    assert(!Statistics::pearsonCorrelation({1, 2, 3, 4}, {1, 2, 3, 4}));

    std::vector<double> returns;
    for (int i = 0; i < 20; ++i) returns.push_back(0.01);
    returns[3] = -0.05;
    returns[11] = -0.08;

    auto var = Statistics::valueAtRisk(returns, 0.95, VaRMethod::HISTORICAL);
    auto cvar = Statistics::conditionalValueAtRisk(returns, 0.95);
    assert(var && cvar);
    // idx = floor(0.05 * 20) = 1 -> sorted[1] = -0.05
    assert(near(*var, 0.05, 1e-12));
    // mean(-0.08, -0.05)
    assert(near(*cvar, 0.065, 1e-12));
    assert(*cvar >= *var);

    auto parametric = Statistics::valueAtRisk(returns, 0.95, VaRMethod::PARAMETRIC);
    assert(parametric && *parametric > 0.0);

    assert(!Statistics::valueAtRisk(std::vector<double>(9, 0.01)));
    assert(!Statistics::conditionalValueAtRisk(std::vector<double>(9, 0.01)));
    std::cout << "[TEST] Correlation / VaR / CVaR PASSED\n";
}

int main() {
    testBasics();
    testOls();
    testAdf();
    testHurstAndHalfLife();
    testZScore();
    testJohansen();
    testCorrelationAndTailRisk();
    std::cout << "[TEST] Statistics PASSED\n";
    return 0;
}
