#include "common/Config.h"
#include "common/PathUtils.h"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <iostream>

namespace quantcore {

namespace {
std::string normalizeName(std::string name) {
    std::transform(name.begin(), name.end(), name.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    auto not_space = [](unsigned char c) { return !std::isspace(c); };
    name.erase(name.begin(), std::find_if(name.begin(), name.end(), not_space));
    name.erase(std::find_if(name.rbegin(), name.rend(), not_space).base(), name.end());

    // alias
    if (name == "pairs") return "pairs_trading";
    if (name == "mean-reversion") return "mean_reversion";
    return name;
}

const nlohmann::json* section(const nlohmann::json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_object()) return nullptr;
    return &(*it);
}
}

Config& Config::getInstance() {
    static Config instance;
    return instance;
}

void Config::reset() {
    *this = Config();
}

bool Config::load(const std::string& path) {
    std::filesystem::path config_path;
    if (std::filesystem::path(path).is_absolute()) {
        config_path = path;
    } else {
        config_path = utils::PathUtils::resolveRelativePath(path);
    }

    std::cerr << "설정 파일 경로: " << config_path << std::endl;

    if (!std::filesystem::exists(config_path)) {
        std::cerr << "경고: 설정 파일을 찾을 수 없습니다: " << config_path
                  << " (기본값 사용)" << std::endl;
        return false;
    }

    std::ifstream file(config_path);
    if (!file.is_open()) {
        std::cerr << "경고: 설정 파일을 열 수 없습니다: " << config_path << std::endl;
        return false;
    }

    try {
        nlohmann::json j;
        file >> j;
        loadFromJson(j);
    } catch (const nlohmann::json::exception& e) {
        std::cerr << "설정 로드 오류: " << e.what() << " (기본값 사용)" << std::endl;
        reset();
        return false;
    }

    std::cerr << "설정 파일 로드 완료 - strategy=" << backtest_strategy_
              << ", kelly_fraction=" << sizer_config_.kelly_fraction << std::endl;
    return true;
}

void Config::loadFromJson(const nlohmann::json& j) {
    if (!j.is_object()) {
        std::cerr << "설정 오류: 최상위 JSON 은 object 여야 합니다" << std::endl;
        return;
    }

    if (auto p = section(j, "pairs_trading")) {
        auto& c = pairs_config_;
        c.hedge_ratio_lookback = p->value("hedge_ratio_lookback", c.hedge_ratio_lookback);
        c.z_score_period = p->value("z_score_period", c.z_score_period);
        c.entry_z_score = p->value("entry_z_score", c.entry_z_score);
        c.exit_z_score = p->value("exit_z_score", c.exit_z_score);
        c.stop_z_score = p->value("stop_z_score", c.stop_z_score);
        c.min_data_points = p->value("min_data_points", c.min_data_points);
        c.hurst_max_lag = p->value("hurst_max_lag", c.hurst_max_lag);
        c.use_kalman = p->value("use_kalman", c.use_kalman);
        c.require_johansen = p->value("require_johansen", c.require_johansen);
        c.kalman_delta = p->value("kalman_delta", c.kalman_delta);
        c.kalman_ve = p->value("kalman_ve", c.kalman_ve);
        c.kalman_initial_p = p->value("kalman_initial_p", c.kalman_initial_p);
    }

    if (auto strategies = section(j, "strategies")) {
        if (auto s = section(*strategies, "technical")) {
            auto& c = technical_config_;
            c.rsi_period = s->value("rsi_period", c.rsi_period);
            c.macd_fast = s->value("macd_fast", c.macd_fast);
            c.macd_slow = s->value("macd_slow", c.macd_slow);
            c.macd_signal = s->value("macd_signal", c.macd_signal);
            c.bollinger_period = s->value("bollinger_period", c.bollinger_period);
            c.bollinger_std_dev = s->value("bollinger_std_dev", c.bollinger_std_dev);
            c.volume_spike_threshold = s->value("volume_spike_threshold", c.volume_spike_threshold);
        }
        if (auto s = section(*strategies, "momentum")) {
            auto& c = momentum_config_;
            c.lookback = s->value("lookback", c.lookback);
            c.vol_window = s->value("vol_window", c.vol_window);
            c.target_risk = s->value("target_risk", c.target_risk);
            c.entry_threshold = s->value("entry_threshold", c.entry_threshold);
        }
        if (auto s = section(*strategies, "mean_reversion")) {
            auto& c = mean_reversion_config_;
            c.z_score_period = s->value("z_score_period", c.z_score_period);
            c.entry_z_score = s->value("entry_z_score", c.entry_z_score);
            c.exit_z_score = s->value("exit_z_score", c.exit_z_score);
            c.stop_z_score = s->value("stop_z_score", c.stop_z_score);
            c.bollinger_period = s->value("bollinger_period", c.bollinger_period);
            c.bollinger_std_dev = s->value("bollinger_std_dev", c.bollinger_std_dev);
            c.hurst_max_lag = s->value("hurst_max_lag", c.hurst_max_lag);
        }
        if (auto s = section(*strategies, "ensemble")) {
            auto& c = ensemble_config_;
            c.default_momentum_weight = s->value("momentum_weight", c.default_momentum_weight);
            c.default_mean_reversion_weight = s->value("mean_reversion_weight", c.default_mean_reversion_weight);
            c.action_threshold = s->value("action_threshold", c.action_threshold);
        }
    }

    if (auto s = section(j, "position_sizer")) {
        auto& c = sizer_config_;
        c.max_position_pct = s->value("max_position_pct", c.max_position_pct);
        c.max_yolo_pct = s->value("max_yolo_pct", c.max_yolo_pct);
        c.yolo_threshold = s->value("yolo_threshold", c.yolo_threshold);
        c.kelly_fraction = s->value("kelly_fraction", c.kelly_fraction);
        c.min_position_value = s->value("min_position_value", c.min_position_value);
        c.max_drawdown_scale = s->value("max_drawdown_scale", c.max_drawdown_scale);
        c.drawdown_threshold = s->value("drawdown_threshold", c.drawdown_threshold);
        c.max_var_pct = s->value("max_var_pct", c.max_var_pct);
        c.max_cvar_pct = s->value("max_cvar_pct", c.max_cvar_pct);
        c.var_confidence = s->value("var_confidence", c.var_confidence);
        c.target_volatility = s->value("target_volatility", c.target_volatility);
        c.rolling_window = s->value("rolling_window", c.rolling_window);
        c.exp_half_life = s->value("exp_half_life", c.exp_half_life);
    }

    if (auto e = section(j, "execution")) {
        auto& c = execution_config_;
        execution_enabled_ = e->value("enabled", execution_enabled_);
        c.slippage_bps = e->value("slippage_bps", c.slippage_bps);
        c.commission_bps = e->value("commission_bps", c.commission_bps);
        c.market_impact_coeff = e->value("market_impact_coeff", c.market_impact_coeff);

        const std::string model = e->value("slippage_model", std::string(execution::toString(c.slippage_model)));
        if (auto parsed = execution::parseSlippageModel(normalizeName(model))) {
            c.slippage_model = *parsed;
        } else {
            std::cerr << "경고: 알 수 없는 slippage_model '" << model << "', fixed 사용" << std::endl;
            c.slippage_model = execution::SlippageModel::FIXED;
        }
    }

    if (auto b = section(j, "backtest")) {
        auto& c = backtest_config_;
        c.initial_balance = b->value("initial_balance", c.initial_balance);
        c.lookback = b->value("lookback", c.lookback);
        c.pairs_lookback = b->value("pairs_lookback", c.pairs_lookback);
        c.min_confidence = b->value("min_confidence", c.min_confidence);
        c.monte_carlo_iterations = b->value("monte_carlo_iterations", c.monte_carlo_iterations);
        c.use_regime_sizing = b->value("use_regime_sizing", c.use_regime_sizing);
        c.risk_free_rate = b->value("risk_free_rate", c.risk_free_rate);
        backtest_strategy_ = normalizeName(b->value("strategy", backtest_strategy_));
        random_seed_ = b->value("random_seed", random_seed_);
    }

    if (auto s = section(j, "scanner")) {
        auto& c = scanner_config_;
        c.min_correlation = s->value("min_correlation", c.min_correlation);
        c.min_score = s->value("min_score", c.min_score);
        c.max_results = s->value("max_results", c.max_results);
        c.target_half_life = s->value("target_half_life", c.target_half_life);
    }

    if (auto l = section(j, "logging")) {
        log_level_ = l->value("level", log_level_);
        log_dir_ = l->value("dir", log_dir_);
    }
}

} // namespace quantcore
