#pragma once

#include <vector>
#include <string>
#include <optional>

namespace quantcore {
namespace analytics {

struct OlsResult {
    double alpha;       // intercept
    double beta;        // slope
    double r_squared;
    std::vector<double> residuals;

    OlsResult() : alpha(0), beta(0), r_squared(0) {}
};

// Simplified ADF: single lag, constant only, fixed critical values
struct AdfResult {
    double statistic;
    double p_value;
    bool is_stationary;

    AdfResult() : statistic(0), p_value(1.0), is_stationary(false) {}
};

struct JohansenResult {
    int rank;                   // 0, 1, 2 (sequential trace test)
    int max_eigen_rank;         // 0, 1, 2 (sequential max-eigenvalue test)
    double trace_stat_r0;       // H0: r = 0
    double trace_stat_r1;       // H0: r <= 1
    double max_eigen_stat_r0;
    double max_eigen_stat_r1;
    double eigenvalue_1;        // larger
    double eigenvalue_2;
    int observations;
    std::string reason;         // set when the test could not run

    JohansenResult()
        : rank(0), max_eigen_rank(0), trace_stat_r0(0), trace_stat_r1(0)
        , max_eigen_stat_r0(0), max_eigen_stat_r1(0)
        , eigenvalue_1(0), eigenvalue_2(0), observations(0) {}
};

enum class VaRMethod { HISTORICAL, PARAMETRIC };

// 통계 함수 모음. 데이터 부족/퇴화 입력은 nullopt 로 표현한다 (NaN 금지)
class Statistics {
public:
    static constexpr double kEpsilon = 1e-12;

    // Osterwald-Lenum 5% critical values, 2 variables, constant in the cointegrating relation
    static constexpr double kTraceCritical5[2] = {15.41, 3.76};
    static constexpr double kMaxEigenCritical5[2] = {14.07, 3.76};

    static constexpr size_t kMinAdfPoints = 20;
    static constexpr size_t kMinHalfLifePoints = 20;
    static constexpr size_t kMinJohansenPoints = 40;
    static constexpr size_t kMinCorrelationPoints = 5;
    static constexpr size_t kMinVaRPoints = 10;

    static double mean(const std::vector<double>& values);
    // Population standard deviation
    static double stdDev(const std::vector<double>& values);

    static std::vector<double> differences(const std::vector<double>& series);
    static std::vector<double> simpleReturns(const std::vector<double>& prices);
    static std::vector<double> logReturns(const std::vector<double>& prices);

    // y = alpha + beta * x
    static std::optional<OlsResult> ols(const std::vector<double>& y, const std::vector<double>& x);

    static std::optional<AdfResult> adfTest(const std::vector<double>& series);

    // Rescaled-range estimate on an increment series, lags 10..max_lag step 2
    static std::optional<double> hurstExponent(const std::vector<double>& increments, int max_lag = 20);

    // Ornstein-Uhlenbeck half-life in bars; nullopt when not mean-reverting
    static std::optional<double> halfLife(const std::vector<double>& series);

    static std::optional<double> zScore(const std::vector<double>& series, size_t period);

    // Never fails: insufficient/singular input is reported as rank 0 with a reason
    static JohansenResult johansenTest(const std::vector<double>& series_a,
                                       const std::vector<double>& series_b);

    static std::optional<double> pearsonCorrelation(const std::vector<double>& x,
                                                    const std::vector<double>& y);

    // Loss fractions are reported as positive numbers
    static std::optional<double> valueAtRisk(const std::vector<double>& returns,
                                             double confidence = 0.95,
                                             VaRMethod method = VaRMethod::HISTORICAL);
    static std::optional<double> conditionalValueAtRisk(const std::vector<double>& returns,
                                                        double confidence = 0.95);

    static double adfPValue(double statistic);
};

} // namespace analytics
} // namespace quantcore
