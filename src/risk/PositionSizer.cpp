#include "risk/PositionSizer.h"
#include "analytics/Statistics.h"
#include "common/Logger.h"
#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <utility>
#include <fmt/format.h>

namespace quantcore {
namespace risk {

using analytics::Statistics;
using analytics::VaRMethod;

namespace {

struct StrategyKellyDefaults {
    const char* name;
    double win_rate;
    double reward_risk;
};

// avg_loss = 1 unit 기준 기본값
constexpr StrategyKellyDefaults kStrategyDefaults[] = {
    {"mean_reversion", 0.62, 1.2},
    {"momentum", 0.55, 2.0},
    {"pairs_trading", 0.55, 1.5},
    {"sentiment_momentum", 0.58, 1.3},
};

struct WinLossSplit {
    double win_rate = 0.0;
    double avg_win = 0.0;
    double avg_loss = 0.0;
    size_t wins = 0;
    size_t losses = 0;
};

// pnl_pct > 0 만 승리, 0 은 손실로 분류
template <typename It>
WinLossSplit splitWinsLosses(It begin, It end) {
    WinLossSplit split;
    double win_sum = 0.0;
    double loss_sum = 0.0;
    for (It it = begin; it != end; ++it) {
        if (it->pnl_pct > 0.0) {
            ++split.wins;
            win_sum += it->pnl_pct;
        } else {
            ++split.losses;
            loss_sum += it->pnl_pct;
        }
    }
    const size_t total = split.wins + split.losses;
    if (total > 0) split.win_rate = static_cast<double>(split.wins) / total;
    if (split.wins > 0) split.avg_win = win_sum / split.wins;
    if (split.losses > 0) split.avg_loss = std::abs(loss_sum / split.losses);
    return split;
}

void requireRange(bool ok, const char* field, const std::string& detail) {
    if (!ok) {
        throw std::invalid_argument(fmt::format("PositionSizer: {} {}", field, detail));
    }
}

} // namespace

PositionSizer::PositionSizer(PositionSizerConfig config)
    : config_(std::move(config))
{
    const auto& c = config_;
    requireRange(c.max_position_pct > 0.0 && c.max_position_pct <= 1.0,
                 "max_position_pct", "must be in (0, 1]");
    requireRange(c.max_yolo_pct >= c.max_position_pct && c.max_yolo_pct <= 1.0,
                 "max_yolo_pct", "must be in [max_position_pct, 1]");
    requireRange(c.yolo_threshold > 0.0 && c.yolo_threshold <= 1.0,
                 "yolo_threshold", "must be in (0, 1]");
    requireRange(c.kelly_fraction > 0.0 && c.kelly_fraction <= 1.0,
                 "kelly_fraction", "must be in (0, 1]");
    requireRange(c.min_position_value >= 0.0, "min_position_value", "must be >= 0");
    requireRange(c.max_drawdown_scale >= 0.0 && c.max_drawdown_scale <= 1.0,
                 "max_drawdown_scale", "must be in [0, 1]");
    requireRange(c.drawdown_threshold > 0.0 && c.drawdown_threshold <= 1.0,
                 "drawdown_threshold", "must be in (0, 1]");
    requireRange(c.max_var_pct > 0.0, "max_var_pct", "must be positive");
    requireRange(c.max_cvar_pct > 0.0, "max_cvar_pct", "must be positive");
    requireRange(c.var_confidence > 0.0 && c.var_confidence < 1.0,
                 "var_confidence", "must be in (0, 1)");
    requireRange(c.target_volatility > 0.0, "target_volatility", "must be positive");
    requireRange(c.rolling_window >= kMinTradesForEstimate,
                 "rolling_window", fmt::format("must be >= {}", kMinTradesForEstimate));
    requireRange(c.exp_half_life > 0.0, "exp_half_life", "must be positive");

    LOG_INFO("PositionSizer initialized - kelly fraction {:.2f}, max {:.0f}% / yolo {:.0f}%",
             c.kelly_fraction, c.max_position_pct * 100.0, c.max_yolo_pct * 100.0);
}

// ===== Kelly family =====

double PositionSizer::kellySize(double win_rate, double avg_win, double avg_loss) const {
    return kellySize(win_rate, avg_win, avg_loss, config_.kelly_fraction);
}

double PositionSizer::kellySize(double win_rate, double avg_win, double avg_loss,
                                double fraction) const {
    if (avg_loss == 0.0 || avg_win == 0.0) return 0.0;
    if (!std::isfinite(win_rate) || !std::isfinite(avg_win) || !std::isfinite(avg_loss)) {
        return 0.0;
    }

    // f* = (p*W - q*L) / W
    const double full_kelly = (win_rate * avg_win - (1.0 - win_rate) * avg_loss) / avg_win;
    if (full_kelly <= 0.0) return 0.0;
    return std::clamp(full_kelly * fraction, 0.0, config_.max_yolo_pct);
}

double PositionSizer::regimeKellyFraction(SizingRegime regime) {
    switch (regime) {
        case SizingRegime::BULL_LOW_VOL: return 0.50;
        case SizingRegime::BEAR_HIGH_VOL: return 0.25;
        case SizingRegime::RANGE_BOUND: return 0.40;
        case SizingRegime::UNCERTAIN: return 0.20;
    }
    return 0.20;
}

double PositionSizer::regimeAdjustedKelly(double win_rate, double avg_win, double avg_loss,
                                          SizingRegime regime) const {
    return kellySize(win_rate, avg_win, avg_loss, regimeKellyFraction(regime));
}

double PositionSizer::drawdownAdjustedKelly(double kelly_pct, double current_drawdown) const {
    if (current_drawdown <= 0.0 || kelly_pct <= 0.0) return kelly_pct;

    // 0% DD 에서 1.0, threshold 에서 max_drawdown_scale 까지 선형 축소
    const double dd_ratio = std::min(current_drawdown / config_.drawdown_threshold, 1.0);
    const double scale = 1.0 - dd_ratio * (1.0 - config_.max_drawdown_scale);
    return kelly_pct * scale;
}

double PositionSizer::adaptiveKellyFraction(size_t sample_size,
                                            std::optional<SizingRegime> regime) const {
    const double base = regime ? regimeKellyFraction(*regime) : config_.kelly_fraction;
    const double n = static_cast<double>(sample_size);

    double sample_confidence = 1.0;
    if (sample_size < 20) {
        sample_confidence = 0.60;
    } else if (sample_size < 50) {
        sample_confidence = 0.60 + 0.30 * ((n - 20.0) / 30.0);
    } else if (sample_size < 100) {
        sample_confidence = 0.90 + 0.10 * ((n - 50.0) / 50.0);
    }

    return std::clamp(base * sample_confidence, 0.20, 0.50);
}

// ===== Tail-risk constraints =====

double PositionSizer::varConstrainedKelly(double kelly_pct, const std::vector<double>& returns,
                                          double max_var_pct) const {
    if (kelly_pct <= 0.0) return 0.0;
    if (returns.size() < Statistics::kMinVaRPoints) return kelly_pct;

    auto var = Statistics::valueAtRisk(returns, config_.var_confidence, VaRMethod::HISTORICAL);
    if (!var || *var <= 0.0) return kelly_pct;

    if (kelly_pct * *var <= max_var_pct) return kelly_pct;
    return max_var_pct / *var;
}

double PositionSizer::cvarConstrainedKelly(double kelly_pct, const std::vector<double>& returns,
                                           double max_cvar_pct) const {
    if (kelly_pct <= 0.0) return 0.0;
    if (returns.size() < Statistics::kMinVaRPoints) return kelly_pct;

    auto cvar = Statistics::conditionalValueAtRisk(returns, config_.var_confidence);
    if (!cvar || *cvar <= 0.0) return kelly_pct;

    if (kelly_pct * *cvar <= max_cvar_pct) return kelly_pct;
    return max_cvar_pct / *cvar;
}

double PositionSizer::costAdjustedKelly(double kelly_pct, double round_trip_cost_pct,
                                        double avg_win) const {
    if (kelly_pct <= 0.0 || avg_win <= 0.0) return 0.0;
    return std::max(0.0, kelly_pct - round_trip_cost_pct / avg_win);
}

// ===== Estimation from trade history =====

std::optional<KellyEstimate> PositionSizer::rollingKellyEstimate(
    const std::vector<TradeRecord>& trades) const {
    if (trades.size() < kMinTradesForEstimate) return std::nullopt;

    const size_t window = std::min(config_.rolling_window, trades.size());
    auto split = splitWinsLosses(trades.end() - window, trades.end());
    if (split.wins == 0 || split.losses == 0) return std::nullopt;

    KellyEstimate estimate;
    estimate.win_rate = split.win_rate;
    estimate.avg_win = split.avg_win;
    estimate.avg_loss = split.avg_loss;
    estimate.kelly_pct = kellySize(split.win_rate, split.avg_win, split.avg_loss);
    estimate.sample_size = static_cast<double>(window);
    return estimate;
}

std::optional<KellyEstimate> PositionSizer::exponentialKellyEstimate(
    const std::vector<TradeRecord>& trades, double half_life) const {
    if (trades.size() < kMinTradesForEstimate || half_life <= 0.0) return std::nullopt;

    const double lambda = std::log(2.0) / half_life;
    const size_t n = trades.size();

    double win_weight = 0.0;
    double loss_weight = 0.0;
    double weighted_win_sum = 0.0;
    double weighted_loss_sum = 0.0;
    double total_weight = 0.0;

    for (size_t i = 0; i < n; ++i) {
        const double age = static_cast<double>(n - 1 - i);  // 0 = 최신
        const double w = std::exp(-lambda * age);
        total_weight += w;
        if (trades[i].pnl_pct > 0.0) {
            win_weight += w;
            weighted_win_sum += w * trades[i].pnl_pct;
        } else {
            loss_weight += w;
            weighted_loss_sum += w * std::abs(trades[i].pnl_pct);
        }
    }

    if (win_weight <= 0.0 || loss_weight <= 0.0) return std::nullopt;

    KellyEstimate estimate;
    estimate.win_rate = win_weight / total_weight;
    estimate.avg_win = weighted_win_sum / win_weight;
    estimate.avg_loss = weighted_loss_sum / loss_weight;
    estimate.kelly_pct = kellySize(estimate.win_rate, estimate.avg_win, estimate.avg_loss);
    estimate.sample_size = total_weight;
    return estimate;
}

std::optional<OptimalFResult> PositionSizer::optimalF(const std::vector<TradeRecord>& trades) const {
    if (trades.size() < kMinTradesForEstimate) return std::nullopt;

    double worst_loss = 0.0;
    for (const auto& t : trades) worst_loss = std::min(worst_loss, t.pnl_pct);
    if (worst_loss >= 0.0) return std::nullopt;

    const double abs_worst = std::abs(worst_loss);
    double best_f = 0.0;
    double best_twr = 1.0;

    // f = 0.01 ~ 1.00 grid
    for (int step = 1; step <= 100; ++step) {
        const double f = step / 100.0;
        double twr = 1.0;
        bool valid = true;
        for (const auto& t : trades) {
            const double hpr = 1.0 + f * (t.pnl_pct / abs_worst);
            if (hpr <= 0.0) {
                valid = false;
                break;
            }
            twr *= hpr;
        }
        if (valid && twr > best_twr) {
            best_twr = twr;
            best_f = f;
        }
    }

    if (best_f == 0.0) return std::nullopt;

    OptimalFResult result;
    result.optimal_f = best_f;
    result.terminal_wealth = best_twr;
    result.worst_loss = worst_loss;
    result.position_pct = best_f * abs_worst * config_.kelly_fraction;
    return result;
}

std::optional<KellyConfidenceInterval> PositionSizer::kellyConfidenceInterval(
    const std::vector<TradeRecord>& trades, std::mt19937_64& rng,
    int resamples, double alpha) const {
    if (trades.size() < kMinTradesForBootstrap || resamples <= 0 ||
        alpha <= 0.0 || alpha >= 1.0) {
        return std::nullopt;
    }

    std::uniform_int_distribution<size_t> pick(0, trades.size() - 1);
    std::vector<TradeRecord> sample(trades.size());
    std::vector<double> kellys;
    kellys.reserve(resamples);

    for (int b = 0; b < resamples; ++b) {
        for (auto& slot : sample) slot = trades[pick(rng)];
        auto split = splitWinsLosses(sample.begin(), sample.end());
        if (split.wins == 0 || split.losses == 0) {
            kellys.push_back(0.0);
            continue;
        }
        kellys.push_back(kellySize(split.win_rate, split.avg_win, split.avg_loss));
    }

    std::sort(kellys.begin(), kellys.end());
    const size_t n = kellys.size();
    auto at = [&](double q) {
        size_t idx = static_cast<size_t>(std::floor(q * n));
        return kellys[std::min(idx, n - 1)];
    };

    KellyConfidenceInterval ci;
    ci.lower = at(alpha / 2.0);
    ci.median = at(0.5);
    ci.upper = at(1.0 - alpha / 2.0);
    ci.spread = ci.upper - ci.lower;
    ci.resamples = resamples;
    return ci;
}

double PositionSizer::strategyKellySize(const std::string& strategy_name,
                                        std::optional<SizingRegime> regime,
                                        const std::vector<TradeRecord>& trades) const {
    // 1) 실제 거래 이력 기반 rolling 추정
    if (trades.size() >= kMinTradesForEstimate) {
        auto estimate = rollingKellyEstimate(trades);
        if (estimate && estimate->kelly_pct > 0.0) {
            if (regime) {
                return regimeAdjustedKelly(estimate->win_rate, estimate->avg_win,
                                           estimate->avg_loss, *regime);
            }
            return estimate->kelly_pct;
        }
    }

    // 2) 전략별 기본값
    for (const auto& d : kStrategyDefaults) {
        if (strategy_name == d.name) {
            if (regime) return regimeAdjustedKelly(d.win_rate, d.reward_risk, 1.0, *regime);
            return kellySize(d.win_rate, d.reward_risk, 1.0);
        }
    }
    return 0.0;
}

// ===== Multi-position =====

std::vector<PortfolioAllocation> PositionSizer::portfolioKelly(
    const std::vector<PortfolioPosition>& positions) const {
    std::vector<PortfolioAllocation> allocations;
    allocations.reserve(positions.size());

    const size_t n = positions.size();
    for (size_t i = 0; i < n; ++i) {
        PortfolioAllocation alloc;
        alloc.name = positions[i].name;
        alloc.kelly_pct = positions[i].kelly_pct;

        double sum_abs_corr = 0.0;
        for (size_t j = 0; j < n; ++j) {
            if (i == j) continue;
            auto corr = Statistics::pearsonCorrelation(positions[i].returns, positions[j].returns);
            sum_abs_corr += corr ? std::abs(*corr) : 0.0;
        }

        alloc.avg_abs_correlation = n > 1 ? sum_abs_corr / (n - 1) : 0.0;
        alloc.diversification_factor =
            1.0 / std::sqrt(1.0 + (n - 1) * alloc.avg_abs_correlation);
        alloc.adjusted_pct = std::max(0.0, alloc.kelly_pct) * alloc.diversification_factor;
        allocations.push_back(alloc);
    }
    return allocations;
}

std::map<std::string, double> PositionSizer::riskParityWeights(
    const std::map<std::string, double>& volatilities) {
    std::map<std::string, double> weights;
    double total_inv_vol = 0.0;
    for (const auto& [name, vol] : volatilities) {
        if (vol > 0.0 && std::isfinite(vol)) total_inv_vol += 1.0 / vol;
    }
    if (total_inv_vol <= 0.0) return weights;

    for (const auto& [name, vol] : volatilities) {
        if (vol > 0.0 && std::isfinite(vol)) weights[name] = (1.0 / vol) / total_inv_vol;
    }
    return weights;
}

// ===== Main sizing pipeline =====

PositionSizingResult PositionSizer::calculate(const SizingRequest& request) const {
    PositionSizingResult result;

    if (!(request.portfolio_value > 0.0) || !(request.price > 0.0) ||
        !(request.confidence > 0.0) || !std::isfinite(request.portfolio_value) ||
        !std::isfinite(request.price)) {
        result.method = "none";
        result.reason = "Invalid inputs";
        return result;
    }

    const double confidence = std::min(request.confidence, 1.0);
    double position_pct = 0.0;
    std::string method;

    // 1) 명시적 통계 기반 Kelly
    const bool has_stats = request.win_rate && request.avg_win_return && request.avg_loss_return;
    if (has_stats) {
        double kelly_pct = 0.0;
        double applied_fraction = config_.kelly_fraction;
        if (request.regime) {
            kelly_pct = regimeAdjustedKelly(*request.win_rate, *request.avg_win_return,
                                            *request.avg_loss_return, *request.regime);
            applied_fraction = regimeKellyFraction(*request.regime);
            method = "kelly+regime";
        } else {
            kelly_pct = kellySize(*request.win_rate, *request.avg_win_return,
                                  *request.avg_loss_return);
            method = "kelly";
        }

        if (kelly_pct > 0.0) {
            if (request.use_adaptive_fraction && !request.trades.empty()) {
                kelly_pct = kelly_pct / applied_fraction *
                            adaptiveKellyFraction(request.trades.size(), request.regime);
                method += "+adaptive";
            }
            position_pct = kelly_pct * confidence;
        } else {
            method.clear();  // standard sizing 으로 fallback
        }
    }

    // 2) 전략 이름 기반 Kelly (이력 -> 기본값). 명시적 통계가 있으면 사용하지 않는다
    if (!has_stats && !request.strategy_name.empty()) {
        double kelly_pct = 0.0;
        double applied_fraction = config_.kelly_fraction;

        if (request.use_exponential_weighting &&
            request.trades.size() >= kMinTradesForEstimate) {
            auto estimate = exponentialKellyEstimate(request.trades, config_.exp_half_life);
            if (estimate && estimate->kelly_pct > 0.0) {
                kelly_pct = estimate->kelly_pct;
                method = "kelly+exp_weighted";
            }
        }
        if (kelly_pct <= 0.0) {
            kelly_pct = strategyKellySize(request.strategy_name, request.regime, request.trades);
            if (kelly_pct > 0.0) {
                method = request.regime ? "kelly+regime" : "kelly+strategy";
                if (request.regime) applied_fraction = regimeKellyFraction(*request.regime);
            }
        }

        if (kelly_pct > 0.0) {
            if (request.use_adaptive_fraction && !request.trades.empty()) {
                kelly_pct = kelly_pct / applied_fraction *
                            adaptiveKellyFraction(request.trades.size(), request.regime);
                method += "+adaptive";
            }
            position_pct = kelly_pct * confidence;
        }
    }

    const bool kelly_applied = !method.empty();

    // 3) Drawdown 축소
    if (kelly_applied && request.current_drawdown && *request.current_drawdown > 0.0) {
        position_pct = drawdownAdjustedKelly(position_pct, *request.current_drawdown);
        method += "+dd_adjusted";
    }

    // 4) 꼬리위험 제약 (CVaR 우선)
    if (kelly_applied && request.returns.size() >= Statistics::kMinVaRPoints) {
        if (request.use_cvar_constraint) {
            position_pct = cvarConstrainedKelly(position_pct, request.returns, config_.max_cvar_pct);
            method += "+cvar";
        } else if (request.use_var_constraint) {
            position_pct = varConstrainedKelly(position_pct, request.returns, config_.max_var_pct);
            method += "+var";
        }
    }

    // 5) 거래비용 반영
    if (kelly_applied && request.transaction_cost_pct && *request.transaction_cost_pct > 0.0) {
        const double avg_win = (request.avg_win_return && *request.avg_win_return > 0.0)
            ? *request.avg_win_return : 0.05;
        position_pct = costAdjustedKelly(position_pct, *request.transaction_cost_pct, avg_win);
        method += "+cost_adj";
    }

    // 6) Kelly 미적용 시 confidence 비례
    if (!kelly_applied) {
        const bool yolo = confidence >= config_.yolo_threshold;
        position_pct = (yolo ? config_.max_yolo_pct : config_.max_position_pct) * confidence;
        method = yolo ? "yolo" : "standard";
    }

    // 7) 변동성 스케일링
    if (request.volatility && *request.volatility > 0.0) {
        position_pct *= std::min(config_.target_volatility / *request.volatility, 1.0);
        method += "+vol_adjusted";
    }

    position_pct = std::clamp(position_pct, 0.0, config_.max_yolo_pct);
    const double value = request.portfolio_value * position_pct;

    if (value < config_.min_position_value) {
        result.method = "skip";
        result.reason = fmt::format("Position value {:.2f} below minimum {:.2f}",
                                    value, config_.min_position_value);
        return result;
    }

    double quantity = std::floor(value / request.price);
    if (quantity <= 0.0) {
        // 고가 자산은 소수점 수량 허용
        quantity = std::round(value / request.price * 1e8) / 1e8;
    }

    result.quantity = quantity;
    result.notional_value = quantity * request.price;
    result.method = method;
    result.position_pct = position_pct * 100.0;
    result.reason = fmt::format("{} sizing at {:.2f}% of portfolio", method, position_pct * 100.0);
    return result;
}

} // namespace risk
} // namespace quantcore
