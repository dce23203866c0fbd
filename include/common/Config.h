#pragma once

#include <string>
#include <nlohmann/json.hpp>
#include "strategy/StrategyConfig.h"
#include "risk/SizingConfig.h"
#include "execution/ExecutionConfig.h"
#include "backtest/BacktestConfig.h"
#include "analytics/PairScanner.h"

namespace quantcore {

// JSON 설정 싱글톤. 없는 key 는 각 구조체 기본값 유지
class Config {
public:
    static Config& getInstance();

    // 상대 경로는 실행 파일 디렉터리 기준. 파일이 없으면 기본값 유지
    bool load(const std::string& config_path);
    void loadFromJson(const nlohmann::json& j);
    // 모든 섹션을 기본값으로 되돌린다
    void reset();

    strategy::PairsTradingConfig getPairsTradingConfig() const { return pairs_config_; }
    strategy::TechnicalSignalConfig getTechnicalConfig() const { return technical_config_; }
    strategy::MomentumConfig getMomentumConfig() const { return momentum_config_; }
    strategy::MeanReversionConfig getMeanReversionConfig() const { return mean_reversion_config_; }
    strategy::EnsembleConfig getEnsembleConfig() const { return ensemble_config_; }
    risk::PositionSizerConfig getPositionSizerConfig() const { return sizer_config_; }
    execution::ExecutionConfig getExecutionConfig() const { return execution_config_; }
    bool isExecutionModelEnabled() const { return execution_enabled_; }
    backtest::BacktestConfig getBacktestConfig() const { return backtest_config_; }
    std::string getBacktestStrategy() const { return backtest_strategy_; }
    unsigned long long getRandomSeed() const { return random_seed_; }
    analytics::PairScannerConfig getScannerConfig() const { return scanner_config_; }
    std::string getLogLevel() const { return log_level_; }
    std::string getLogDir() const { return log_dir_; }

private:
    Config() = default;

    strategy::PairsTradingConfig pairs_config_;
    strategy::TechnicalSignalConfig technical_config_;
    strategy::MomentumConfig momentum_config_;
    strategy::MeanReversionConfig mean_reversion_config_;
    strategy::EnsembleConfig ensemble_config_;
    risk::PositionSizerConfig sizer_config_;
    execution::ExecutionConfig execution_config_;
    bool execution_enabled_ = true;
    backtest::BacktestConfig backtest_config_;
    std::string backtest_strategy_ = "ensemble";
    unsigned long long random_seed_ = 42;
    analytics::PairScannerConfig scanner_config_;
    std::string log_level_ = "info";
    std::string log_dir_ = "logs";
};

} // namespace quantcore
