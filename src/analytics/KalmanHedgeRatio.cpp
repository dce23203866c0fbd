#include "analytics/KalmanHedgeRatio.h"
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace quantcore {
namespace analytics {

KalmanHedgeRatio::KalmanHedgeRatio(double delta, double ve, double initial_p)
    : delta_(delta)
    , ve_(ve)
    , initial_p_(initial_p) {
    if (!(delta_ > 0.0) || !(ve_ > 0.0) || !(initial_p_ > 0.0)) {
        throw std::invalid_argument("KalmanHedgeRatio: delta, ve and initial_p must be positive");
    }
    reset();
}

void KalmanHedgeRatio::reset() {
    state_.beta = 0.0;
    state_.covariance_p = initial_p_;
    observations_ = 0;
}

double KalmanHedgeRatio::update(double y, double x) {
    if (!std::isfinite(y) || !std::isfinite(x)) {
        return state_.beta;
    }

    const double p_pred = state_.covariance_p + delta_;
    const double innovation = y - state_.beta * x;
    const double s = x * x * p_pred + ve_;   // ve_ > 0 이므로 s > 0
    const double k = x * p_pred / s;

    state_.beta += k * innovation;
    state_.covariance_p = std::max((1.0 - k * x) * p_pred, 0.0);
    ++observations_;
    return state_.beta;
}

std::vector<double> KalmanHedgeRatio::filter(const std::vector<double>& series_y,
                                             const std::vector<double>& series_x) {
    reset();
    // 길이가 다르면 최신 구간 기준으로 정렬
    const size_t n = std::min(series_y.size(), series_x.size());
    const size_t off_y = series_y.size() - n;
    const size_t off_x = series_x.size() - n;
    std::vector<double> betas;
    betas.reserve(n);
    for (size_t i = 0; i < n; ++i) {
        betas.push_back(update(series_y[off_y + i], series_x[off_x + i]));
    }
    return betas;
}

} // namespace analytics
} // namespace quantcore
