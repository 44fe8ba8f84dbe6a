#include "market/Candle.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>

namespace Confluence {

const char* to_string(CandleError e) {
    switch (e) {
        case CandleError::NONE:                    return "NONE";
        case CandleError::NON_FINITE:              return "NON_FINITE";
        case CandleError::NEGATIVE_VALUE:          return "NEGATIVE_VALUE";
        case CandleError::INCONSISTENT_OHLC:       return "INCONSISTENT_OHLC";
        case CandleError::NON_MONOTONIC_TIMESTAMP: return "NON_MONOTONIC_TIMESTAMP";
    }
    return "UNKNOWN";
}

CandleCheck validate_candle(const Candle& c) {
    CandleCheck check;
    const double fields[5] = {c.open, c.high, c.low, c.close, c.volume};

    for (double v : fields) {
        if (!std::isfinite(v)) {
            check.error = CandleError::NON_FINITE;
            return check;
        }
    }
    for (double v : fields) {
        if (v < 0.0) {
            check.error = CandleError::NEGATIVE_VALUE;
            return check;
        }
    }

    const double body_hi = std::max(c.open, c.close);
    const double body_lo = std::min(c.open, c.close);
    if (c.high < body_hi || body_lo < c.low)
        check.error = CandleError::INCONSISTENT_OHLC;

    return check;
}

CandleCheck validate_candles(const std::vector<Candle>& candles) {
    for (size_t i = 0; i < candles.size(); ++i) {
        CandleCheck check = validate_candle(candles[i]);
        if (check.ok() && i > 0 && candles[i].timestamp <= candles[i - 1].timestamp)
            check.error = CandleError::NON_MONOTONIC_TIMESTAMP;

        if (!check.ok()) {
            check.index = i;
            return check;
        }
    }
    return CandleCheck{};
}

CandleSeries::CandleSeries(std::vector<Candle> candles)
    : candles_(std::move(candles))
{
    CandleCheck check = validate_candles(candles_);
    if (!check.ok()) {
        throw std::invalid_argument(
            std::string("CandleSeries: ") + to_string(check.error) +
            " at index " + std::to_string(check.index));
    }

    if (!candles_.empty()) {
        double sum = 0.0;
        for (const Candle& c : candles_)
            sum += c.range();
        avg_range_ = sum / static_cast<double>(candles_.size());
    }
}

CandleWindow CandleSeries::window(size_t first, size_t count) const {
    CandleWindow w;
    if (first >= candles_.size())
        return w;
    w.data = candles_.data() + first;
    w.size = std::min(count, candles_.size() - first);
    return w;
}

CandleWindow CandleSeries::window_ending_at(size_t last, size_t count) const {
    if (candles_.empty() || count == 0)
        return CandleWindow{};
    last = std::min(last, candles_.size() - 1);
    const size_t first = (last + 1 >= count) ? last + 1 - count : 0;
    return window(first, last + 1 - first);
}

}
