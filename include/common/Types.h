#pragma once

#include <string>
#include <vector>
#include <map>
#include <optional>

namespace quantcore {

using Price = double;
using Volume = double;
using Amount = double;

enum class OrderSide { BUY, SELL };

inline const char* toString(OrderSide side) {
    return side == OrderSide::BUY ? "BUY" : "SELL";
}

// OHLCV 바 (불변)
struct Candle {
    double open;
    double high;
    double low;
    double close;
    double volume;
    long long timestamp;
    
    Candle() : open(0), high(0), low(0), close(0), volume(0), timestamp(0) {}
    
    Candle(double o, double h, double l, double c, double v, long long t)
        : open(o), high(h), low(l), close(c), volume(v), timestamp(t) {}
};

// 체결 기록. pnl / duration_bars 는 청산 체결에만 채워진다.
struct Trade {
    std::string symbol;
    OrderSide side;
    Volume quantity;
    Price price;            // intended price
    Price realized_price;   // after slippage
    Amount fee;
    std::optional<Amount> pnl;
    std::optional<int> duration_bars;
    std::string exit_reason;
    int bar_index;

    Trade()
        : side(OrderSide::BUY)
        , quantity(0.0)
        , price(0.0)
        , realized_price(0.0)
        , fee(0.0)
        , bar_index(-1)
    {}
};

struct Position {
    Volume quantity = 0.0;
    Price avg_price = 0.0;
};

// Backtest-local ledger, owned by a single run
struct Portfolio {
    Amount cash = 0.0;
    std::map<std::string, Position> positions;

    bool hasPosition(const std::string& symbol) const {
        auto it = positions.find(symbol);
        return it != positions.end() && it->second.quantity > 0.0;
    }
};

} // namespace quantcore
