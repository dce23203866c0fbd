#include "common/Logger.h"
#include "common/Config.h"
#include "backtest/BacktestEngine.h"
#include "backtest/PairsBacktestEngine.h"
#include "backtest/PerformanceMetrics.h"
#include "backtest/DataHistory.h"
#include "analytics/PairScanner.h"
#include "analytics/TechnicalIndicators.h"
#include "strategy/TechnicalSignalStrategy.h"
#include "strategy/MomentumStrategy.h"
#include "strategy/MeanReversionStrategy.h"
#include "strategy/EnsembleStrategy.h"
#include "strategy/PairsTradingStrategy.h"

#include <nlohmann/json.hpp>

#include <cmath>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <map>
#include <memory>
#include <random>
#include <string>
#include <vector>

using namespace quantcore;

namespace {

void printUsage() {
    std::cout << "Usage:\n";
    std::cout << "  quantcore_backtest --backtest <candles.csv|json> [options]\n";
    std::cout << "  quantcore_backtest --pairs <a.csv> <b.csv> [options]\n";
    std::cout << "  quantcore_backtest --scan <file> <file> [<file> ...] [options]\n\n";
    std::cout << "Options:\n";
    std::cout << "  --config <path>            설정 파일 (기본값: config/config.json)\n";
    std::cout << "  --strategy <name>          technical | momentum | mean_reversion | ensemble\n";
    std::cout << "  --initial-capital <value>  초기 자본\n";
    std::cout << "  --json                     결과를 JSON 으로 출력\n";
}

std::shared_ptr<strategy::IStrategy> makeStrategy(const std::string& name, const Config& config) {
    if (name == "technical") {
        return std::make_shared<strategy::TechnicalSignalStrategy>(config.getTechnicalConfig());
    }
    if (name == "momentum") {
        return std::make_shared<strategy::MomentumStrategy>(config.getMomentumConfig());
    }
    if (name == "mean_reversion") {
        return std::make_shared<strategy::MeanReversionStrategy>(config.getMeanReversionConfig());
    }
    if (name == "ensemble") {
        return std::make_shared<strategy::EnsembleStrategy>(
            config.getEnsembleConfig(), config.getMomentumConfig(), config.getMeanReversionConfig());
    }
    return nullptr;
}

std::shared_ptr<execution::ExecutionModel> makeExecutionModel(const Config& config) {
    if (!config.isExecutionModelEnabled()) return nullptr;
    return std::make_shared<execution::ExecutionModel>(config.getExecutionConfig());
}

std::string symbolFromPath(const std::string& path) {
    return std::filesystem::path(path).stem().string();
}

nlohmann::json toJson(const backtest::PerformanceReport& r) {
    nlohmann::json j;
    j["initial_balance"] = r.initial_balance;
    j["final_balance"] = r.final_balance;
    j["total_pnl"] = r.total_pnl;
    j["total_return_pct"] = r.total_return;
    j["total_trades"] = r.total_trades;
    j["wins"] = r.wins;
    j["losses"] = r.losses;
    j["win_rate_pct"] = r.win_rate;
    j["avg_win"] = r.avg_win;
    j["avg_loss"] = r.avg_loss;
    // JSON 은 Infinity 를 표현할 수 없다
    j["profit_factor"] = std::isfinite(r.profit_factor) ? nlohmann::json(r.profit_factor) : nlohmann::json("inf");
    j["max_drawdown_pct"] = r.max_drawdown;
    j["sharpe"] = r.sharpe;
    j["sortino"] = std::isfinite(r.sortino) ? nlohmann::json(r.sortino) : nlohmann::json("inf");
    j["calmar"] = std::isfinite(r.calmar) ? nlohmann::json(r.calmar) : nlohmann::json("inf");
    j["avg_duration_bars"] = r.avg_duration_bars;
    j["exit_reasons"] = r.exit_reasons;
    if (r.execution_costs) {
        j["execution_costs"] = {
            {"total_slippage", r.execution_costs->total_slippage},
            {"total_commission", r.execution_costs->total_commission},
            {"total_costs", r.execution_costs->total_costs},
        };
    }
    if (!r.error.empty()) j["error"] = r.error;
    return j;
}

void printReport(const std::string& title, const backtest::PerformanceReport& r) {
    std::cout << "\n" << title << "\n";
    std::cout << "---------------------------------------------\n";
    if (!r.ok()) {
        std::cout << "오류: " << r.error << "\n";
        return;
    }
    std::cout << std::fixed << std::setprecision(2);
    std::cout << "최종 잔고:     " << r.final_balance << "\n";
    std::cout << "총 수익:       " << r.total_pnl << " (" << r.total_return << "%)\n";
    std::cout << "MDD:          " << r.max_drawdown << "%\n";
    std::cout << "총 거래 수:    " << r.total_trades << " (승 " << r.wins << " / 패 " << r.losses << ")\n";
    std::cout << "승률:          " << r.win_rate << "%\n";
    std::cout << "평균 이익:     " << r.avg_win << "\n";
    std::cout << "평균 손실:     " << r.avg_loss << "\n";
    std::cout << "Profit Factor: " << r.profit_factor << "\n";
    std::cout << "Sharpe:        " << r.sharpe << "\n";
    std::cout << "Sortino:       " << r.sortino << "\n";
    std::cout << "Calmar:        " << r.calmar << "\n";
    std::cout << "평균 보유 봉:   " << r.avg_duration_bars << "\n";
    if (!r.exit_reasons.empty()) {
        std::cout << "청산 사유:\n";
        for (const auto& [reason, count] : r.exit_reasons) {
            std::cout << "  - " << reason << ": " << count << "\n";
        }
    }
    if (r.execution_costs) {
        std::cout << "체결 비용:     slippage " << r.execution_costs->total_slippage
                  << ", commission " << r.execution_costs->total_commission
                  << ", total " << r.execution_costs->total_costs << "\n";
    }
}

void printMonteCarlo(const backtest::MonteCarloResult& mc) {
    if (!mc.ok()) {
        std::cout << "Monte Carlo:   " << mc.error << "\n";
        return;
    }
    std::cout << "Monte Carlo:   Sharpe " << mc.observed_sharpe
              << ", p-value " << std::setprecision(3) << mc.p_value
              << ", percentile " << mc.percentile
              << ", median random Sharpe " << std::setprecision(2) << mc.median_random_sharpe
              << " (" << mc.iterations << " shuffles)\n";
    std::cout << "---------------------------------------------\n";
}

nlohmann::json toJson(const backtest::MonteCarloResult& mc) {
    if (!mc.ok()) return {{"error", mc.error}};
    return {
        {"observed_sharpe", mc.observed_sharpe},
        {"p_value", mc.p_value},
        {"percentile", mc.percentile},
        {"median_random_sharpe", mc.median_random_sharpe},
        {"iterations", mc.iterations},
    };
}

int runSingle(const std::string& path, const std::string& strategy_name, bool json_mode) {
    auto& config = Config::getInstance();
    const auto candles = backtest::DataHistory::load(path);
    if (candles.empty()) {
        std::cerr << "데이터를 불러오지 못했습니다: " << path << "\n";
        return 1;
    }

    auto strategy = makeStrategy(strategy_name, config);
    if (!strategy) {
        std::cerr << "알 수 없는 전략: " << strategy_name << "\n";
        return 1;
    }

    backtest::BacktestEngine engine(strategy,
                                    std::make_shared<risk::PositionSizer>(config.getPositionSizerConfig()),
                                    makeExecutionModel(config),
                                    config.getBacktestConfig());
    const auto report = engine.run(symbolFromPath(path), candles);

    std::mt19937_64 rng(config.getRandomSeed());
    const auto mc = backtest::PerformanceMetrics::monteCarloPermutation(
        report.equity_curve, rng, config.getBacktestConfig().monte_carlo_iterations);

    if (json_mode) {
        auto j = toJson(report);
        j["symbol"] = report.symbol;
        j["strategy"] = strategy->getName();
        j["monte_carlo"] = toJson(mc);
        std::cout << j.dump(2) << std::endl;
    } else {
        printReport("백테스트 결과: " + report.symbol + " (" + strategy->getName() + ")", report);
        if (report.ok()) printMonteCarlo(mc);
    }
    return report.ok() ? 0 : 1;
}

int runPairs(const std::string& path_a, const std::string& path_b, bool json_mode) {
    auto& config = Config::getInstance();
    const auto candles_a = backtest::DataHistory::load(path_a);
    const auto candles_b = backtest::DataHistory::load(path_b);
    const auto aligned = backtest::DataHistory::alignCloses(candles_a, candles_b);
    if (aligned.first.empty()) {
        std::cerr << "공통 timestamp 가 없습니다: " << path_a << ", " << path_b << "\n";
        return 1;
    }

    backtest::PairsBacktestEngine engine(
        std::make_shared<strategy::PairsTradingStrategy>(config.getPairsTradingConfig()),
        std::make_shared<risk::PositionSizer>(config.getPositionSizerConfig()),
        makeExecutionModel(config),
        config.getBacktestConfig());

    const auto report = engine.run(aligned.first, aligned.second,
                                   symbolFromPath(path_a), symbolFromPath(path_b));

    std::mt19937_64 rng(config.getRandomSeed());
    const auto mc = backtest::PerformanceMetrics::monteCarloPermutation(
        report.equity_curve, rng, config.getBacktestConfig().monte_carlo_iterations);

    if (json_mode) {
        auto j = toJson(report);
        j["symbol_a"] = report.symbol_a;
        j["symbol_b"] = report.symbol_b;
        j["data_points"] = report.data_points;
        j["monte_carlo"] = toJson(mc);
        std::cout << j.dump(2) << std::endl;
    } else {
        printReport("페어 백테스트 결과: " + report.symbol_a + " / " + report.symbol_b, report);
        if (report.ok()) printMonteCarlo(mc);
    }
    return report.ok() ? 0 : 1;
}

int runScan(const std::vector<std::string>& paths, bool json_mode) {
    auto& config = Config::getInstance();
    std::map<std::string, std::vector<double>> universe;
    for (const auto& path : paths) {
        const auto candles = backtest::DataHistory::load(path);
        if (candles.empty()) {
            std::cerr << "건너뜀 (데이터 없음): " << path << "\n";
            continue;
        }
        universe[symbolFromPath(path)] = analytics::TechnicalIndicators::extractClosePrices(candles);
    }

    analytics::PairScanner scanner(config.getScannerConfig(), config.getPairsTradingConfig());
    const auto candidates = scanner.scan(universe);

    if (json_mode) {
        nlohmann::json arr = nlohmann::json::array();
        for (const auto& c : candidates) {
            nlohmann::json item = {
                {"symbol_a", c.symbol_a},
                {"symbol_b", c.symbol_b},
                {"correlation", c.correlation},
                {"hedge_ratio", c.hedge_ratio},
                {"score", c.score},
                {"johansen_rank", c.cointegration.johansen_rank},
            };
            if (c.cointegration.adf_statistic) item["adf_statistic"] = *c.cointegration.adf_statistic;
            if (c.cointegration.hurst_exponent) item["hurst"] = *c.cointegration.hurst_exponent;
            if (c.cointegration.half_life_bars) item["half_life_bars"] = *c.cointegration.half_life_bars;
            arr.push_back(item);
        }
        std::cout << arr.dump(2) << std::endl;
        return 0;
    }

    std::cout << "\n페어 스캔 결과 (" << universe.size() << " symbols, "
              << candidates.size() << " pairs)\n";
    std::cout << "---------------------------------------------\n";
    std::cout << std::fixed << std::setprecision(3);
    for (const auto& c : candidates) {
        std::cout << "  " << c.symbol_a << " / " << c.symbol_b
                  << "  score " << c.score
                  << "  corr " << c.correlation
                  << "  hedge " << c.hedge_ratio
                  << "  rank " << c.cointegration.johansen_rank << "\n";
    }
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    try {
        if (argc < 3) {
            printUsage();
            return 1;
        }

        const std::string mode = argv[1];
        std::vector<std::string> inputs;
        std::string config_path = "config/config.json";
        std::string strategy_override;
        double cli_initial_capital = -1.0;
        bool json_mode = false;

        for (int i = 2; i < argc; ++i) {
            const std::string arg = argv[i];
            if (arg == "--json") {
                json_mode = true;
            } else if (arg == "--config" && i + 1 < argc) {
                config_path = argv[++i];
            } else if (arg == "--strategy" && i + 1 < argc) {
                strategy_override = argv[++i];
            } else if (arg == "--initial-capital" && i + 1 < argc) {
                try {
                    cli_initial_capital = std::stod(argv[++i]);
                } catch (const std::exception&) {
                    std::cerr << "Invalid --initial-capital value. Ignored.\n";
                }
            } else {
                inputs.push_back(arg);
            }
        }

        auto& config = Config::getInstance();
        config.load(config_path);
        if (cli_initial_capital > 0.0 || !strategy_override.empty()) {
            nlohmann::json overrides = {{"backtest", nlohmann::json::object()}};
            if (cli_initial_capital > 0.0) overrides["backtest"]["initial_balance"] = cli_initial_capital;
            if (!strategy_override.empty()) overrides["backtest"]["strategy"] = strategy_override;
            config.loadFromJson(overrides);
        }

        // JSON 출력 모드에서는 콘솔 로그를 오류로 제한
        Logger::getInstance().initialize(config.getLogDir(), json_mode ? "err" : config.getLogLevel());
        LOG_INFO("QuantCore backtest runner - mode {}", mode);

        if (mode == "--backtest" && inputs.size() == 1) {
            return runSingle(inputs[0], config.getBacktestStrategy(), json_mode);
        }
        if (mode == "--pairs" && inputs.size() == 2) {
            return runPairs(inputs[0], inputs[1], json_mode);
        }
        if (mode == "--scan" && inputs.size() >= 2) {
            return runScan(inputs, json_mode);
        }

        printUsage();
        return 1;
    } catch (const std::exception& e) {
        LOG_ERROR("Fatal error: {}", e.what());
        std::cerr << "\n오류가 발생했습니다: " << e.what() << std::endl;
        return 1;
    }
}
