#include "backtest/DataHistory.h"
#include "common/Logger.h"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <initializer_list>
#include <iterator>
#include <sstream>
#include <nlohmann/json.hpp>

namespace quantcore {
namespace backtest {

namespace {

std::string trim(std::string s) {
    auto not_space = [](unsigned char ch) { return !std::isspace(ch); };
    s.erase(s.begin(), std::find_if(s.begin(), s.end(), not_space));
    s.erase(std::find_if(s.rbegin(), s.rend(), not_space).base(), s.end());
    return s;
}

std::string normalizeCell(std::string s) {
    s = trim(std::move(s));
    // UTF-8 BOM
    if (s.size() >= 3 &&
        static_cast<unsigned char>(s[0]) == 0xEF &&
        static_cast<unsigned char>(s[1]) == 0xBB &&
        static_cast<unsigned char>(s[2]) == 0xBF) {
        s = s.substr(3);
    }
    if (s.size() >= 2 && s.front() == '"' && s.back() == '"') {
        s = s.substr(1, s.size() - 2);
    }
    return trim(std::move(s));
}

bool endsWith(const std::string& s, const std::string& suffix) {
    if (s.size() < suffix.size()) return false;
    return std::equal(suffix.rbegin(), suffix.rend(), s.rbegin(), [](char a, char b) {
        return std::tolower(static_cast<unsigned char>(a)) == std::tolower(static_cast<unsigned char>(b));
    });
}

// 첫 번째로 존재하는 key 의 숫자 값
template <typename T>
bool readField(const nlohmann::json& item, const char* key, const char* short_key, T& out) {
    for (const char* k : {key, short_key}) {
        auto it = item.find(k);
        if (it != item.end() && it->is_number()) {
            out = it->get<T>();
            return true;
        }
    }
    return false;
}

} // namespace

std::vector<Candle> DataHistory::loadCSV(const std::string& file_path) {
    std::vector<Candle> candles;
    std::ifstream file(file_path);
    if (!file.is_open()) {
        LOG_ERROR("Failed to open CSV file: {}", file_path);
        return candles;
    }

    std::string line;
    size_t skipped = 0;
    while (std::getline(file, line)) {
        std::stringstream ss(line);
        std::string cell;
        std::vector<std::string> row;
        while (std::getline(ss, cell, ',')) {
            row.push_back(normalizeCell(cell));
        }

        if (row.size() < 6 || row[0].empty()) continue;
        if (!std::isdigit(static_cast<unsigned char>(row[0][0])) && row[0][0] != '-') {
            continue;  // header
        }

        try {
            candles.emplace_back(std::stod(row[1]), std::stod(row[2]), std::stod(row[3]),
                                 std::stod(row[4]), std::stod(row[5]), std::stoll(row[0]));
        } catch (const std::exception& e) {
            ++skipped;
            LOG_WARN("Skipping malformed CSV row: {} - {}", line, e.what());
        }
    }

    candles = normalize(std::move(candles));
    LOG_INFO("Loaded {} candles from {} ({} rows skipped)", candles.size(), file_path, skipped);
    return candles;
}

std::vector<Candle> DataHistory::loadJSON(const std::string& file_path) {
    std::vector<Candle> candles;
    std::ifstream file(file_path);
    if (!file.is_open()) {
        LOG_ERROR("Failed to open JSON file: {}", file_path);
        return candles;
    }

    try {
        nlohmann::json j;
        file >> j;
        if (!j.is_array()) {
            LOG_ERROR("JSON candle file must be an array: {}", file_path);
            return candles;
        }

        for (const auto& item : j) {
            Candle candle;
            if (item.is_array()) {
                // [t, o, h, l, c, v]
                if (item.size() < 6) continue;
                candle.timestamp = item[0].get<long long>();
                candle.open = item[1].get<double>();
                candle.high = item[2].get<double>();
                candle.low = item[3].get<double>();
                candle.close = item[4].get<double>();
                candle.volume = item[5].get<double>();
            } else if (item.is_object()) {
                if (!readField(item, "close", "c", candle.close)) continue;
                readField(item, "timestamp", "t", candle.timestamp);
                readField(item, "open", "o", candle.open);
                readField(item, "high", "h", candle.high);
                readField(item, "low", "l", candle.low);
                readField(item, "volume", "v", candle.volume);
            } else {
                continue;
            }
            candles.push_back(candle);
        }
    } catch (const nlohmann::json::exception& e) {
        LOG_ERROR("Error parsing JSON file: {} - {}", file_path, e.what());
        return {};
    }

    candles = normalize(std::move(candles));
    LOG_INFO("Loaded {} candles from {}", candles.size(), file_path);
    return candles;
}

std::vector<Candle> DataHistory::load(const std::string& file_path) {
    if (endsWith(file_path, ".json")) {
        return loadJSON(file_path);
    }
    return loadCSV(file_path);
}

std::vector<Candle> DataHistory::normalize(std::vector<Candle> candles) {
    std::stable_sort(candles.begin(), candles.end(), [](const Candle& a, const Candle& b) {
        return a.timestamp < b.timestamp;
    });
    const size_t before = candles.size();
    candles.erase(std::unique(candles.begin(), candles.end(), [](const Candle& a, const Candle& b) {
        return a.timestamp == b.timestamp;
    }), candles.end());

    if (candles.size() != before) {
        LOG_WARN("Dropped {} duplicate-timestamp candles", before - candles.size());
    }
    return candles;
}

std::vector<Candle> DataHistory::filterByTimestamp(const std::vector<Candle>& candles,
                                                   long long start_ts, long long end_ts) {
    std::vector<Candle> filtered;
    std::copy_if(candles.begin(), candles.end(), std::back_inserter(filtered), [&](const Candle& c) {
        return (start_ts <= 0 || c.timestamp >= start_ts) && (end_ts <= 0 || c.timestamp <= end_ts);
    });
    return filtered;
}

std::pair<std::vector<double>, std::vector<double>> DataHistory::alignCloses(
    const std::vector<Candle>& a, const std::vector<Candle>& b) {
    std::pair<std::vector<double>, std::vector<double>> aligned;

    // 둘 다 timestamp 오름차순이라고 가정 (normalize 결과)
    size_t i = 0;
    size_t j = 0;
    while (i < a.size() && j < b.size()) {
        if (a[i].timestamp < b[j].timestamp) {
            ++i;
        } else if (b[j].timestamp < a[i].timestamp) {
            ++j;
        } else {
            aligned.first.push_back(a[i].close);
            aligned.second.push_back(b[j].close);
            ++i;
            ++j;
        }
    }
    return aligned;
}

} // namespace backtest
} // namespace quantcore
