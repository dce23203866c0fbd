#include "analytics/Statistics.h"
#include <cmath>
#include <algorithm>
#include <numeric>
#include <limits>
#include <string>

namespace quantcore {
namespace analytics {

namespace {

struct Matrix2 {
    double a11, a12, a21, a22;

    double determinant() const { return a11 * a22 - a12 * a21; }
    double trace() const { return a11 + a22; }

    Matrix2 operator*(const Matrix2& o) const {
        return {a11 * o.a11 + a12 * o.a21, a11 * o.a12 + a12 * o.a22,
                a21 * o.a11 + a22 * o.a21, a21 * o.a12 + a22 * o.a22};
    }

    Matrix2 transposed() const { return {a11, a21, a12, a22}; }
};

std::optional<Matrix2> inverse(const Matrix2& m) {
    const double det = m.determinant();
    if (std::abs(det) < 1e-18) {
        return std::nullopt;
    }
    return Matrix2{m.a22 / det, -m.a12 / det, -m.a21 / det, m.a11 / det};
}

// (1/T) * sum(x_t y_t') for 2-column data
Matrix2 momentMatrix(const std::vector<double>& x1, const std::vector<double>& x2,
                     const std::vector<double>& y1, const std::vector<double>& y2) {
    Matrix2 m{0.0, 0.0, 0.0, 0.0};
    const double t = static_cast<double>(x1.size());
    for (size_t i = 0; i < x1.size(); ++i) {
        m.a11 += x1[i] * y1[i];
        m.a12 += x1[i] * y2[i];
        m.a21 += x2[i] * y1[i];
        m.a22 += x2[i] * y2[i];
    }
    m.a11 /= t; m.a12 /= t; m.a21 /= t; m.a22 /= t;
    return m;
}

void demean(std::vector<double>& values) {
    const double mu = Statistics::mean(values);
    for (auto& v : values) v -= mu;
}

std::vector<double> tail(const std::vector<double>& values, size_t count) {
    return std::vector<double>(values.end() - static_cast<std::ptrdiff_t>(count), values.end());
}

double parametricZ(double confidence) {
    if (std::abs(confidence - 0.90) < 1e-9) return 1.282;
    if (std::abs(confidence - 0.99) < 1e-9) return 2.326;
    return 1.645;
}

size_t tailIndex(double confidence, size_t n) {
    const auto idx = static_cast<size_t>(std::floor((1.0 - confidence) * static_cast<double>(n)));
    return std::min(idx, n - 1);
}

} // namespace

double Statistics::mean(const std::vector<double>& values) {
    if (values.empty()) return 0.0;
    return std::accumulate(values.begin(), values.end(), 0.0) / static_cast<double>(values.size());
}

double Statistics::stdDev(const std::vector<double>& values) {
    if (values.empty()) return 0.0;
    const double mu = mean(values);
    double sum_sq = 0.0;
    for (double v : values) {
        sum_sq += (v - mu) * (v - mu);
    }
    return std::sqrt(sum_sq / static_cast<double>(values.size()));
}

std::vector<double> Statistics::differences(const std::vector<double>& series) {
    std::vector<double> out;
    if (series.size() < 2) return out;
    out.reserve(series.size() - 1);
    for (size_t i = 1; i < series.size(); ++i) {
        out.push_back(series[i] - series[i - 1]);
    }
    return out;
}

std::vector<double> Statistics::simpleReturns(const std::vector<double>& prices) {
    std::vector<double> out;
    if (prices.size() < 2) return out;
    out.reserve(prices.size() - 1);
    for (size_t i = 1; i < prices.size(); ++i) {
        // 0 가격은 수익률 정의 불가 -> 0 으로 처리
        out.push_back(prices[i - 1] != 0.0 ? (prices[i] - prices[i - 1]) / prices[i - 1] : 0.0);
    }
    return out;
}

std::vector<double> Statistics::logReturns(const std::vector<double>& prices) {
    std::vector<double> out;
    if (prices.size() < 2) return out;
    out.reserve(prices.size() - 1);
    for (size_t i = 1; i < prices.size(); ++i) {
        if (prices[i] > 0.0 && prices[i - 1] > 0.0) {
            out.push_back(std::log(prices[i] / prices[i - 1]));
        } else {
            out.push_back(0.0);
        }
    }
    return out;
}

std::optional<OlsResult> Statistics::ols(const std::vector<double>& y, const std::vector<double>& x) {
    const size_t n = y.size();
    if (n != x.size() || n < 3) {
        return std::nullopt;
    }

    double sum_x = 0.0, sum_y = 0.0, sum_xy = 0.0, sum_x2 = 0.0;
    for (size_t i = 0; i < n; ++i) {
        sum_x += x[i];
        sum_y += y[i];
        sum_xy += x[i] * y[i];
        sum_x2 += x[i] * x[i];
    }

    const double dn = static_cast<double>(n);
    const double mean_x = sum_x / dn;
    double sxx = 0.0;
    for (double xi : x) {
        sxx += (xi - mean_x) * (xi - mean_x);
    }
    // 상수 회귀변수 (분산 0)
    if (sxx < kEpsilon * std::max(1.0, sum_x2)) {
        return std::nullopt;
    }

    const double denom = dn * sum_x2 - sum_x * sum_x;
    if (std::abs(denom) < kEpsilon) {
        return std::nullopt;
    }

    OlsResult result;
    result.beta = (dn * sum_xy - sum_x * sum_y) / denom;
    result.alpha = (sum_y - result.beta * sum_x) / dn;

    const double mean_y = sum_y / dn;
    double ss_res = 0.0, ss_tot = 0.0;
    result.residuals.reserve(n);
    for (size_t i = 0; i < n; ++i) {
        const double r = y[i] - result.alpha - result.beta * x[i];
        result.residuals.push_back(r);
        ss_res += r * r;
        ss_tot += (y[i] - mean_y) * (y[i] - mean_y);
    }
    result.r_squared = ss_tot > kEpsilon ? 1.0 - ss_res / ss_tot : 0.0;
    return result;
}

double Statistics::adfPValue(double statistic) {
    if (statistic <= -3.51) return 0.01;
    if (statistic <= -2.89) return 0.05;
    if (statistic <= -2.58) return 0.10;
    if (statistic <= -1.95) return 0.30;
    return 0.50;
}

std::optional<AdfResult> Statistics::adfTest(const std::vector<double>& series) {
    if (series.size() < kMinAdfPoints) {
        return std::nullopt;
    }

    // Δy_t = γ y_{t-1} + c + ε (1 lag, 상수항만)
    std::vector<double> delta = differences(series);
    std::vector<double> lagged(series.begin(), series.end() - 1);
    const size_t m = delta.size();

    const double mean_d = mean(delta);
    const double mean_l = mean(lagged);

    double sxy = 0.0, sxx = 0.0;
    for (size_t i = 0; i < m; ++i) {
        sxy += (lagged[i] - mean_l) * (delta[i] - mean_d);
        sxx += (lagged[i] - mean_l) * (lagged[i] - mean_l);
    }
    if (sxx < kEpsilon) {
        return std::nullopt;
    }

    const double gamma = sxy / sxx;
    double sse = 0.0;
    for (size_t i = 0; i < m; ++i) {
        const double r = (delta[i] - mean_d) - gamma * (lagged[i] - mean_l);
        sse += r * r;
    }

    const double se = std::sqrt(sse / ((static_cast<double>(m) - 2.0) * sxx));
    if (!(se > kEpsilon)) {
        return std::nullopt;
    }

    AdfResult result;
    result.statistic = gamma / se;
    result.p_value = adfPValue(result.statistic);
    result.is_stationary = result.p_value <= 0.05;
    return result;
}

std::optional<double> Statistics::hurstExponent(const std::vector<double>& increments, int max_lag) {
    if (max_lag < 10 || increments.size() < static_cast<size_t>(max_lag) * 2) {
        return std::nullopt;
    }

    std::vector<double> log_lags;
    std::vector<double> log_rs;

    for (int lag = 10; lag <= max_lag; lag += 2) {
        const size_t chunk_len = static_cast<size_t>(lag);
        const size_t chunks = increments.size() / chunk_len;
        if (chunks < 1) continue;

        double rs_sum = 0.0;
        int valid = 0;
        for (size_t c = 0; c < chunks; ++c) {
            auto begin = increments.begin() + static_cast<std::ptrdiff_t>(c * chunk_len);
            std::vector<double> chunk(begin, begin + static_cast<std::ptrdiff_t>(chunk_len));
            const double mu = mean(chunk);

            // 누적 편차의 범위 (R)
            double cum = 0.0;
            double hi = -std::numeric_limits<double>::infinity();
            double lo = std::numeric_limits<double>::infinity();
            for (double v : chunk) {
                cum += v - mu;
                hi = std::max(hi, cum);
                lo = std::min(lo, cum);
            }
            const double sd = stdDev(chunk);
            if (sd > kEpsilon) {
                rs_sum += (hi - lo) / sd;
                ++valid;
            }
        }
        if (valid > 0 && rs_sum > 0.0) {
            log_lags.push_back(std::log(static_cast<double>(lag)));
            log_rs.push_back(std::log(rs_sum / valid));
        }
    }

    if (log_lags.size() < 2) {
        return std::nullopt;
    }

    auto fit = ols(log_rs, log_lags);
    if (!fit) {
        return std::nullopt;
    }
    return fit->beta;
}

std::optional<double> Statistics::halfLife(const std::vector<double>& series) {
    if (series.size() < kMinHalfLifePoints) {
        return std::nullopt;
    }

    double sxy = 0.0, sxx = 0.0;
    for (size_t i = 1; i < series.size(); ++i) {
        const double lag = series[i - 1];
        sxy += lag * (series[i] - lag);
        sxx += lag * lag;
    }
    if (sxx < kEpsilon) {
        return std::nullopt;
    }

    const double theta = sxy / sxx;
    if (theta >= 0.0) {
        return std::nullopt;
    }
    return -std::log(2.0) / theta;
}

std::optional<double> Statistics::zScore(const std::vector<double>& series, size_t period) {
    if (period == 0 || series.size() < period) {
        return std::nullopt;
    }
    const auto window = tail(series, period);
    const double sd = stdDev(window);
    if (sd < kEpsilon) {
        return 0.0;
    }
    return (series.back() - mean(window)) / sd;
}

JohansenResult Statistics::johansenTest(const std::vector<double>& series_a,
                                        const std::vector<double>& series_b) {
    JohansenResult result;
    const size_t n = std::min(series_a.size(), series_b.size());
    if (n < kMinJohansenPoints) {
        result.reason = "Need at least " + std::to_string(kMinJohansenPoints) +
                        " observations, got " + std::to_string(n);
        return result;
    }

    const auto a = tail(series_a, n);
    const auto b = tail(series_b, n);

    // VECM(0 lagged differences): R0 = ΔY_t, R1 = Y_{t-1}, 둘 다 평균 제거
    std::vector<double> d_a = differences(a);
    std::vector<double> d_b = differences(b);
    std::vector<double> l_a(a.begin(), a.end() - 1);
    std::vector<double> l_b(b.begin(), b.end() - 1);
    demean(d_a); demean(d_b); demean(l_a); demean(l_b);

    const int t = static_cast<int>(n - 1);
    result.observations = t;

    const Matrix2 s00 = momentMatrix(d_a, d_b, d_a, d_b);
    const Matrix2 s11 = momentMatrix(l_a, l_b, l_a, l_b);
    const Matrix2 s01 = momentMatrix(d_a, d_b, l_a, l_b);
    const Matrix2 s10 = s01.transposed();

    const auto s00_inv = inverse(s00);
    const auto s11_inv = inverse(s11);
    if (!s00_inv || !s11_inv) {
        result.reason = "Singular residual moment matrix";
        return result;
    }

    // |λ S11 - S10 S00^-1 S01| = 0  <=>  eig(S11^-1 S10 S00^-1 S01)
    const Matrix2 m = (*s11_inv * s10) * (*s00_inv * s01);
    const double tr = m.trace();
    const double det = m.determinant();
    const double disc = std::sqrt(std::max(tr * tr - 4.0 * det, 0.0));

    const double upper = 1.0 - 1e-12;
    const double lambda1 = std::clamp((tr + disc) / 2.0, 0.0, upper);
    const double lambda2 = std::clamp((tr - disc) / 2.0, 0.0, upper);
    result.eigenvalue_1 = lambda1;
    result.eigenvalue_2 = lambda2;

    const double dt = static_cast<double>(t);
    result.trace_stat_r0 = -dt * (std::log(1.0 - lambda1) + std::log(1.0 - lambda2));
    result.trace_stat_r1 = -dt * std::log(1.0 - lambda2);
    result.max_eigen_stat_r0 = -dt * std::log(1.0 - lambda1);
    result.max_eigen_stat_r1 = result.trace_stat_r1;

    // 순차 trace 검정
    if (result.trace_stat_r0 > kTraceCritical5[0]) {
        result.rank = 1;
        if (result.trace_stat_r1 > kTraceCritical5[1]) {
            result.rank = 2;
        }
    }

    // 순차 max-eigenvalue 검정 (H1: r = r0 + 1)
    if (result.max_eigen_stat_r0 > kMaxEigenCritical5[0]) {
        result.max_eigen_rank = 1;
        if (result.max_eigen_stat_r1 > kMaxEigenCritical5[1]) {
            result.max_eigen_rank = 2;
        }
    }
    return result;
}

std::optional<double> Statistics::pearsonCorrelation(const std::vector<double>& x,
                                                     const std::vector<double>& y) {
    const size_t len = std::min(x.size(), y.size());
    if (len < kMinCorrelationPoints) {
        return std::nullopt;
    }
    const auto xs = tail(x, len);
    const auto ys = tail(y, len);
    const double mx = mean(xs);
    const double my = mean(ys);

    double cov = 0.0, var_x = 0.0, var_y = 0.0;
    for (size_t i = 0; i < len; ++i) {
        const double dx = xs[i] - mx;
        const double dy = ys[i] - my;
        cov += dx * dy;
        var_x += dx * dx;
        var_y += dy * dy;
    }
    const double denom = std::sqrt(var_x * var_y);
    if (denom < kEpsilon) {
        return std::nullopt;
    }
    return std::clamp(cov / denom, -1.0, 1.0);
}

std::optional<double> Statistics::valueAtRisk(const std::vector<double>& returns,
                                              double confidence,
                                              VaRMethod method) {
    if (returns.size() < kMinVaRPoints || confidence <= 0.0 || confidence >= 1.0) {
        return std::nullopt;
    }

    if (method == VaRMethod::PARAMETRIC) {
        return -(mean(returns) - parametricZ(confidence) * stdDev(returns));
    }

    std::vector<double> sorted = returns;
    std::sort(sorted.begin(), sorted.end());
    return -sorted[tailIndex(confidence, sorted.size())];
}

std::optional<double> Statistics::conditionalValueAtRisk(const std::vector<double>& returns,
                                                         double confidence) {
    if (returns.size() < kMinVaRPoints || confidence <= 0.0 || confidence >= 1.0) {
        return std::nullopt;
    }

    std::vector<double> sorted = returns;
    std::sort(sorted.begin(), sorted.end());
    const size_t cutoff = tailIndex(confidence, sorted.size());

    // tail = sorted[0..cutoff] (VaR 지점 포함)
    double sum = 0.0;
    for (size_t i = 0; i <= cutoff; ++i) {
        sum += sorted[i];
    }
    return -(sum / static_cast<double>(cutoff + 1));
}

} // namespace analytics
} // namespace quantcore
