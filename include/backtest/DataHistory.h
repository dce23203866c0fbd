#pragma once

#include "common/Types.h"
#include <string>
#include <utility>
#include <vector>

namespace quantcore {
namespace backtest {

// 과거 OHLCV 로더. 실패 시 로그를 남기고 빈 벡터를 반환한다
class DataHistory {
public:
    // timestamp,open,high,low,close,volume (header / BOM / quoted cell 허용)
    static std::vector<Candle> loadCSV(const std::string& file_path);

    // [{timestamp|t, open|o, high|h, low|l, close|c, volume|v}, ...]
    // 또는 [[t, o, h, l, c, v], ...]
    static std::vector<Candle> loadJSON(const std::string& file_path);

    // 확장자로 CSV / JSON 선택
    static std::vector<Candle> load(const std::string& file_path);

    // 오름차순 정렬, 중복 timestamp 는 먼저 나온 봉만 유지
    static std::vector<Candle> normalize(std::vector<Candle> candles);

    // [start_ts, end_ts] 구간 (0 은 무제한)
    static std::vector<Candle> filterByTimestamp(const std::vector<Candle>& candles,
                                                 long long start_ts, long long end_ts);

    // 두 자산의 공통 timestamp 만 남긴 종가 쌍
    static std::pair<std::vector<double>, std::vector<double>> alignCloses(
        const std::vector<Candle>& a, const std::vector<Candle>& b);
};

} // namespace backtest
} // namespace quantcore
