#pragma once

#include <vector>

namespace quantcore {
namespace analytics {

struct KalmanState {
    double beta = 0.0;
    double covariance_p = 1.0;
};

// Scalar Kalman filter tracking a time-varying hedge ratio: y = beta * x (no intercept).
// State: beta. F = 1, Q = delta, H = x, R = ve.
class KalmanHedgeRatio {
public:
    explicit KalmanHedgeRatio(double delta = 1e-4, double ve = 1e-3, double initial_p = 1.0);

    // 예측 후 갱신. 갱신된 beta 반환
    double update(double y, double x);

    // reset() 후 전체 시계열 재생, 시점별 beta 반환
    std::vector<double> filter(const std::vector<double>& series_y,
                               const std::vector<double>& series_x);

    void reset();

    const KalmanState& state() const { return state_; }
    double beta() const { return state_.beta; }
    double covariance() const { return state_.covariance_p; }
    long long observations() const { return observations_; }

private:
    double delta_;
    double ve_;
    double initial_p_;
    KalmanState state_;
    long long observations_ = 0;
};

} // namespace analytics
} // namespace quantcore
