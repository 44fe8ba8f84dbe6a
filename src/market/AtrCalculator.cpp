#include "market/AtrCalculator.hpp"

#include <algorithm>
#include <cmath>

namespace Confluence {

AtrCalculator::AtrCalculator(size_t period)
    : period_(period == 0 ? 1 : period) {}

double AtrCalculator::true_range(const Candle& c, const Candle* prev) {
    double tr = c.high - c.low;
    if (prev) {
        tr = std::max(tr, std::abs(c.high - prev->close));
        tr = std::max(tr, std::abs(c.low - prev->close));
    }
    return tr;
}

std::vector<std::optional<double>> AtrCalculator::compute(const CandleSeries& series) const {
    const size_t n = series.size();
    std::vector<std::optional<double>> out(n);
    std::vector<double> tr(n);

    double sum = 0.0;
    for (size_t i = 0; i < n; ++i) {
        tr[i] = true_range(series[i], i > 0 ? &series[i - 1] : nullptr);
        sum += tr[i];
        if (i >= period_)
            sum -= tr[i - period_];
        if (i + 1 >= period_)
            out[i] = sum / static_cast<double>(period_);
    }
    return out;
}

std::optional<double> AtrCalculator::latest(const CandleSeries& series) const {
    const size_t n = series.size();
    if (n < period_)
        return std::nullopt;

    double sum = 0.0;
    for (size_t i = n - period_; i < n; ++i)
        sum += true_range(series[i], i > 0 ? &series[i - 1] : nullptr);
    return sum / static_cast<double>(period_);
}

}
