// =============================================================================
// Candle.hpp - OHLCV bar and the validated, immutable series built from bars
// =============================================================================
// RULES:
//   - Prices and volume finite and non-negative
//   - high >= max(open, close) >= min(open, close) >= low
//   - Timestamps strictly increasing
//   - Nothing downstream re-checks these. Validate once, here.
// =============================================================================
#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace Confluence {

struct Candle {
    int64_t timestamp = 0;   // epoch ms
    double open   = 0.0;
    double high   = 0.0;
    double low    = 0.0;
    double close  = 0.0;
    double volume = 0.0;

    double range() const { return high - low; }
};

enum class CandleError : uint8_t {
    NONE                    = 0,
    NON_FINITE              = 1,
    NEGATIVE_VALUE          = 2,
    INCONSISTENT_OHLC       = 3,
    NON_MONOTONIC_TIMESTAMP = 4
};

const char* to_string(CandleError e);

struct CandleCheck {
    CandleError error = CandleError::NONE;
    size_t index = 0;

    bool ok() const { return error == CandleError::NONE; }
};

CandleCheck validate_candle(const Candle& c);
CandleCheck validate_candles(const std::vector<Candle>& candles);

// Non-owning view over a contiguous run of candles.
struct CandleWindow {
    const Candle* data = nullptr;
    size_t size = 0;

    bool empty() const { return size == 0; }
    const Candle& operator[](size_t i) const { return data[i]; }
    const Candle& back() const { return data[size - 1]; }
    const Candle* begin() const { return data; }
    const Candle* end() const { return data + size; }
};

class CandleSeries {
public:
    CandleSeries() = default;

    // Throws std::invalid_argument naming the error and offending index.
    explicit CandleSeries(std::vector<Candle> candles);

    size_t size() const { return candles_.size(); }
    bool empty() const { return candles_.empty(); }

    const Candle& operator[](size_t i) const { return candles_[i]; }
    const Candle& back() const { return candles_.back(); }
    const std::vector<Candle>& candles() const { return candles_; }

    std::vector<Candle>::const_iterator begin() const { return candles_.begin(); }
    std::vector<Candle>::const_iterator end() const { return candles_.end(); }

    // Mean of (high - low); 0 for an empty series.
    double average_range() const { return avg_range_; }

    // [first, first + count), clipped to the series.
    CandleWindow window(size_t first, size_t count) const;

    // The `count` candles ending at `last` inclusive, clipped at the front.
    CandleWindow window_ending_at(size_t last, size_t count) const;

    CandleWindow all() const { return window(0, candles_.size()); }

private:
    std::vector<Candle> candles_;
    double avg_range_ = 0.0;
};

}
