#include "indicators/IndicatorEngine.h"

#include <algorithm>

namespace indicators {
namespace {

constexpr std::size_t kSarMinCandles = 5;

double smoothingFactor(int period) {
    return 2.0 / (static_cast<double>(period) + 1.0);
}

}  // namespace

IndicatorSeries IndicatorEngine::computeEMA(const Candles& candles, const EmaParams& params) {
    IndicatorSeries series;
    series.id = params.name();
    const std::size_t candleCount = candles.size();
    series.values.assign(candleCount, std::nullopt);

    const int period = params.period;
    if (period <= 0 || candleCount < static_cast<std::size_t>(period)) {
        return series;
    }

    const double alpha = smoothingFactor(period);
    const auto seedIndex = static_cast<std::size_t>(period - 1);

    double sum = 0.0;
    for (std::size_t i = 0; i <= seedIndex; ++i) {
        sum += candles[i].close;
    }
    double ema = sum / static_cast<double>(period);
    series.values[seedIndex] = ema;

    for (std::size_t i = seedIndex + 1; i < candleCount; ++i) {
        ema = candles[i].close * alpha + ema * (1.0 - alpha);
        series.values[i] = ema;
    }

    return series;
}

IndicatorSeries IndicatorEngine::computeRSI(const Candles& candles, const RsiParams& params) {
    IndicatorSeries series;
    series.id = params.name();
    const std::size_t candleCount = candles.size();
    series.values.assign(candleCount, std::nullopt);

    const int period = params.period;
    if (period <= 0 || candleCount <= static_cast<std::size_t>(period)) {
        return series;
    }

    const auto p = static_cast<std::size_t>(period);
    const auto rsiOf = [](double avgGain, double avgLoss) {
        if (avgLoss == 0.0) {
            return 100.0;
        }
        return 100.0 - 100.0 / (1.0 + avgGain / avgLoss);
    };

    double avgGain = 0.0;
    double avgLoss = 0.0;
    for (std::size_t i = 1; i < candleCount; ++i) {
        const double change = candles[i].close - candles[i - 1].close;
        const double gain = change > 0.0 ? change : 0.0;
        const double loss = change < 0.0 ? -change : 0.0;

        if (i < p) {
            avgGain += gain;
            avgLoss += loss;
            continue;
        }
        if (i == p) {
            avgGain = (avgGain + gain) / static_cast<double>(period);
            avgLoss = (avgLoss + loss) / static_cast<double>(period);
        }
        else {
            avgGain = (avgGain * static_cast<double>(period - 1) + gain) / static_cast<double>(period);
            avgLoss = (avgLoss * static_cast<double>(period - 1) + loss) / static_cast<double>(period);
        }
        series.values[i] = rsiOf(avgGain, avgLoss);
    }

    return series;
}

KdjSeries IndicatorEngine::computeKDJ(const Candles& candles, const KdjParams& params) {
    KdjSeries series;
    const std::size_t candleCount = candles.size();
    series.k.assign(candleCount, std::nullopt);
    series.d.assign(candleCount, std::nullopt);
    series.j.assign(candleCount, std::nullopt);

    const int period = params.period;
    if (period <= 0 || candleCount < static_cast<std::size_t>(period)) {
        return series;
    }

    const auto p = static_cast<std::size_t>(period);
    double k = 50.0;
    double d = 50.0;
    for (std::size_t i = p - 1; i < candleCount; ++i) {
        double low = candles[i].low;
        double high = candles[i].high;
        for (std::size_t w = i + 1 - p; w < i; ++w) {
            low = std::min(low, candles[w].low);
            high = std::max(high, candles[w].high);
        }

        const double rsv = high == low ? 50.0 : (candles[i].close - low) / (high - low) * 100.0;
        k = (2.0 / 3.0) * k + (1.0 / 3.0) * rsv;
        d = (2.0 / 3.0) * d + (1.0 / 3.0) * k;

        series.k[i] = k;
        series.d[i] = d;
        series.j[i] = 3.0 * k - 2.0 * d;
    }

    return series;
}

SarSeries IndicatorEngine::computeSAR(const Candles& candles, const SarParams& params) {
    SarSeries series;
    const std::size_t candleCount = candles.size();
    series.values.assign(candleCount, std::nullopt);
    series.uptrend.assign(candleCount, std::nullopt);
    series.af.assign(candleCount, std::nullopt);

    if (candleCount < kSarMinCandles) {
        return series;
    }

    bool uptrend = candles[0].close > candles[0].open;
    double ep = uptrend ? candles[0].high : candles[0].low;
    double af = params.startAf;
    double sar = uptrend ? candles[0].low : candles[0].high;

    series.values[0] = sar;
    series.uptrend[0] = uptrend;
    series.af[0] = af;

    for (std::size_t i = 1; i < candleCount; ++i) {
        const auto& current = candles[i];
        const auto& prev1 = candles[i - 1];
        const auto& prev2 = i > 1 ? candles[i - 2] : prev1;

        double next = sar + af * (ep - sar);
        if (uptrend) {
            next = std::min({next, prev1.low, prev2.low});
        }
        else {
            next = std::max({next, prev1.high, prev2.high});
        }

        if (uptrend && current.low < next) {
            uptrend = false;
            next = ep;
            ep = current.low;
            af = params.startAf;
        }
        else if (!uptrend && current.high > next) {
            uptrend = true;
            next = ep;
            ep = current.high;
            af = params.startAf;
        }
        else if (uptrend && current.high > ep) {
            ep = current.high;
            af = std::min(af + params.startAf, params.maxAf);
        }
        else if (!uptrend && current.low < ep) {
            ep = current.low;
            af = std::min(af + params.startAf, params.maxAf);
        }

        sar = next;
        series.values[i] = sar;
        series.uptrend[i] = uptrend;
        series.af[i] = af;
    }

    return series;
}

std::optional<Trend> IndicatorEngine::trendFromSar(const Candles& candles, const SarSeries& sar) {
    if (candles.empty() || sar.values.size() != candles.size() || !sar.values.back()) {
        return std::nullopt;
    }
    return candles.back().close > *sar.values.back() ? Trend::Up : Trend::Down;
}

std::optional<CandleStats> IndicatorEngine::candleStats(const Candles& candles, std::size_t index) {
    if (index >= candles.size()) {
        return std::nullopt;
    }
    const auto& candle = candles[index];
    const double prevClose = index > 0 ? candles[index - 1].close : candle.open;
    if (prevClose == 0.0) {
        return std::nullopt;
    }

    CandleStats stats;
    stats.changePercent = (candle.close - prevClose) / prevClose * 100.0;
    stats.amplitudePercent = (candle.high - candle.low) / prevClose * 100.0;
    return stats;
}

}  // namespace indicators
