#include <cmath>
#include <iostream>
#include <string>
#include <vector>

#include "domain/Types.h"
#include "indicators/IndicatorCoordinator.h"
#include "indicators/IndicatorEngine.h"

using indicators::IndicatorEngine;

namespace {

domain::Candle makeCandle(domain::TimestampMs t, double o, double h, double l, double c) {
    return domain::Candle{t, o, h, l, c, 1.0};
}

std::vector<domain::Candle> closesOnly(const std::vector<double>& closes) {
    std::vector<domain::Candle> candles;
    for (std::size_t i = 0; i < closes.size(); ++i) {
        const double c = closes[i];
        candles.push_back(makeCandle(static_cast<domain::TimestampMs>(i) * 60'000, c, c, c, c));
    }
    return candles;
}

bool near(double a, double b, double eps = 1e-9) {
    return std::fabs(a - b) <= eps;
}

bool checkEma() {
    const auto candles = closesOnly({1, 2, 3, 4, 5, 6, 7, 8, 9, 10});
    const auto ema = IndicatorEngine::computeEMA(candles, indicators::EmaParams{3});
    if (ema.values.size() != candles.size() || ema.id != "EMA(3)") {
        std::cerr << "EMA output size/id mismatch\n";
        return false;
    }
    if (ema.values[0] || ema.values[1]) {
        std::cerr << "EMA warm-up values must be null\n";
        return false;
    }
    if (!ema.values[2] || *ema.values[2] != 2.0) {
        std::cerr << "EMA seed must equal the mean of the first closes\n";
        return false;
    }
    if (!ema.values[3] || *ema.values[3] != 3.0) {
        std::cerr << "EMA recurrence mismatch at index 3\n";
        return false;
    }

    const auto tooShort = IndicatorEngine::computeEMA(closesOnly({1, 2}), indicators::EmaParams{3});
    for (const auto& v : tooShort.values) {
        if (v) {
            std::cerr << "EMA over fewer candles than its period must be all null\n";
            return false;
        }
    }
    const auto nonPositive = IndicatorEngine::computeEMA(candles, indicators::EmaParams{0});
    for (const auto& v : nonPositive.values) {
        if (v) {
            std::cerr << "EMA with a non-positive period must be all null\n";
            return false;
        }
    }
    return true;
}

bool checkRsi() {
    const auto rising = closesOnly({1, 2, 3, 4, 5, 6, 7, 8, 9, 10, 11, 12, 13, 14, 15, 16, 17});
    const auto rsi = IndicatorEngine::computeRSI(rising, indicators::RsiParams{14});
    for (std::size_t i = 0; i < 14; ++i) {
        if (rsi.values[i]) {
            std::cerr << "RSI must be null before index 14, index " << i << "\n";
            return false;
        }
    }
    for (std::size_t i = 14; i < rsi.values.size(); ++i) {
        if (!rsi.values[i] || *rsi.values[i] != 100.0) {
            std::cerr << "RSI without losses must be exactly 100 at index " << i << "\n";
            return false;
        }
    }

    const auto zigzag = closesOnly({1, 2, 1, 2});
    const auto small = IndicatorEngine::computeRSI(zigzag, indicators::RsiParams{2});
    if (!small.values[2] || *small.values[2] != 50.0) {
        std::cerr << "RSI(2) seed expected 50\n";
        return false;
    }
    if (!small.values[3] || *small.values[3] != 75.0) {
        std::cerr << "RSI(2) Wilder step expected 75, got " << small.values[3].value_or(-1) << "\n";
        return false;
    }

    const auto mixed = closesOnly({44, 44.3, 44.1, 43.6, 44.3, 44.8, 45.1, 45.4, 45.8, 46.1, 45.9, 46.3, 45.8,
                                   46.2, 45.6, 46.3, 46.3, 46.0, 46.4, 46.2, 45.6, 46.2});
    const auto band = IndicatorEngine::computeRSI(mixed, indicators::RsiParams{14});
    for (const auto& v : band.values) {
        if (v && (*v < 0.0 || *v > 100.0)) {
            std::cerr << "RSI out of [0,100]: " << *v << "\n";
            return false;
        }
    }
    return true;
}

bool checkKdj() {
    std::vector<domain::Candle> candles{
        makeCandle(0, 10, 12, 9, 11),
        makeCandle(1, 11, 13, 10, 12),
        makeCandle(2, 12, 13, 11, 12.5),
        makeCandle(3, 12.5, 14, 12, 13.5),
        makeCandle(4, 13.5, 14.5, 12.5, 13),
        makeCandle(5, 13, 13.5, 11.5, 12),
        makeCandle(6, 12, 12.5, 10.5, 11),
        makeCandle(7, 11, 12, 10, 11.5),
        makeCandle(8, 11.5, 13, 11, 12.5),
    };
    const auto kdj = IndicatorEngine::computeKDJ(candles, indicators::KdjParams{3});
    if (kdj.k[0] || kdj.k[1] || kdj.d[1] || kdj.j[1]) {
        std::cerr << "KDJ must be null before index period-1\n";
        return false;
    }

    const double rsv2 = (12.5 - 9.0) / (13.0 - 9.0) * 100.0;
    const double k2 = (2.0 / 3.0) * 50.0 + (1.0 / 3.0) * rsv2;
    const double d2 = (2.0 / 3.0) * 50.0 + (1.0 / 3.0) * k2;
    if (!kdj.k[2] || !near(*kdj.k[2], k2) || !kdj.d[2] || !near(*kdj.d[2], d2)) {
        std::cerr << "KDJ seed step mismatch at index 2\n";
        return false;
    }

    const double rsv3 = (13.5 - 10.0) / (14.0 - 10.0) * 100.0;
    const double k3 = (2.0 / 3.0) * k2 + (1.0 / 3.0) * rsv3;
    const double d3 = (2.0 / 3.0) * d2 + (1.0 / 3.0) * k3;
    if (!kdj.k[3] || !near(*kdj.k[3], k3) || !kdj.d[3] || !near(*kdj.d[3], d3) || !near(*kdj.j[3], 3 * k3 - 2 * d3)) {
        std::cerr << "KDJ recurrence mismatch at index 3\n";
        return false;
    }

    for (std::size_t i = 2; i < candles.size(); ++i) {
        if (*kdj.j[i] != 3.0 * *kdj.k[i] - 2.0 * *kdj.d[i]) {
            std::cerr << "J != 3K-2D at index " << i << "\n";
            return false;
        }
    }

    std::vector<domain::Candle> flat;
    for (int i = 0; i < 6; ++i) {
        flat.push_back(makeCandle(i, 5, 5, 5, 5));
    }
    const auto flatKdj = IndicatorEngine::computeKDJ(flat, indicators::KdjParams{3});
    for (std::size_t i = 2; i < flat.size(); ++i) {
        if (*flatKdj.k[i] != 50.0 || *flatKdj.d[i] != 50.0 || *flatKdj.j[i] != 50.0) {
            std::cerr << "Flat window must keep K=D=J=50 at index " << i << "\n";
            return false;
        }
    }
    return true;
}

bool checkSar() {
    const indicators::SarParams params{};

    if (!IndicatorEngine::computeSAR({}, params).values.empty()) {
        std::cerr << "SAR of an empty series must be empty\n";
        return false;
    }
    const auto four = IndicatorEngine::computeSAR(closesOnly({1, 2, 3, 4}), params);
    for (const auto& v : four.values) {
        if (v) {
            std::cerr << "SAR below five candles must be all null\n";
            return false;
        }
    }

    std::vector<domain::Candle> candles{
        makeCandle(0, 10, 11.5, 9.5, 11),
        makeCandle(1, 11, 12.5, 10.5, 12),
        makeCandle(2, 12, 13.5, 11.5, 13),
        makeCandle(3, 13, 14.5, 12.5, 14),
        makeCandle(4, 14, 15.5, 13.5, 15),
        makeCandle(5, 15, 11, 8, 9),
        makeCandle(6, 9, 10, 9, 9.5),
    };
    const auto sar = IndicatorEngine::computeSAR(candles, params);

    if (*sar.values[0] != 9.5 || *sar.uptrend[0] != true) {
        std::cerr << "SAR must seed from the low of a rising first candle\n";
        return false;
    }
    if (*sar.values[1] != 9.5 || *sar.values[2] != 9.5) {
        std::cerr << "SAR must be clamped under the prior two lows\n";
        return false;
    }
    if (!near(*sar.values[3], 9.74) || !near(*sar.values[4], 10.1208)) {
        std::cerr << "SAR step mismatch: " << *sar.values[3] << " " << *sar.values[4] << "\n";
        return false;
    }
    if (*sar.uptrend[4] != true || *sar.uptrend[5] != false) {
        std::cerr << "SAR trend must flip exactly on the breaching candle\n";
        return false;
    }
    if (*sar.values[5] != 15.5 || *sar.af[5] != params.startAf) {
        std::cerr << "SAR reversal must reset to the extreme point and start af\n";
        return false;
    }
    for (std::size_t i = 1; i <= 4; ++i) {
        if (!near(*sar.af[i] - *sar.af[i - 1], params.startAf)) {
            std::cerr << "af must step by startAf on new extremes, index " << i << "\n";
            return false;
        }
    }
    if (*sar.af[6] != *sar.af[5] || *sar.values[6] != 15.5) {
        std::cerr << "af must hold without a new extreme\n";
        return false;
    }

    const auto trend = IndicatorEngine::trendFromSar(candles, sar);
    if (!trend || *trend != indicators::Trend::Down) {
        std::cerr << "Close below SAR must read as a down trend\n";
        return false;
    }

    std::vector<domain::Candle> climb;
    for (int i = 0; i < 30; ++i) {
        const double base = 10.0 + i;
        climb.push_back(makeCandle(i, base, base + 1.5, base - 0.5, base + 1.0));
    }
    const auto capped = IndicatorEngine::computeSAR(climb, params);
    for (std::size_t i = 0; i < climb.size(); ++i) {
        if (*capped.af[i] > params.maxAf) {
            std::cerr << "af exceeded maxAf at index " << i << "\n";
            return false;
        }
    }
    if (!near(*capped.af.back(), params.maxAf)) {
        std::cerr << "af should saturate at maxAf on a long climb\n";
        return false;
    }
    return true;
}

bool checkCandleStats() {
    std::vector<domain::Candle> candles{makeCandle(0, 10, 12, 9, 11), makeCandle(1, 11, 13, 10, 12)};
    const auto first = IndicatorEngine::candleStats(candles, 0);
    const auto second = IndicatorEngine::candleStats(candles, 1);
    if (!first || !near(first->changePercent, 10.0) || !near(first->amplitudePercent, 30.0)) {
        std::cerr << "First candle stats must use its own open\n";
        return false;
    }
    if (!second || !near(second->changePercent, 100.0 / 11.0) || !near(second->amplitudePercent, 300.0 / 11.0)) {
        std::cerr << "Candle stats must use the previous close\n";
        return false;
    }
    if (IndicatorEngine::candleStats(candles, 2)) {
        std::cerr << "Out of range stats must be empty\n";
        return false;
    }
    return true;
}

bool checkCoordinatorCache() {
    indicators::IndicatorCoordinator coordinator;
    std::vector<double> closes;
    for (int i = 0; i < 120; ++i) {
        closes.push_back(100.0 + (i % 7) - (i % 3));
    }
    const auto candles = closesOnly(closes);

    const auto first = coordinator.getOverlays("Binance:BTC:1m", candles, indicators::SeriesVersion{1, 1});
    const auto again = coordinator.getOverlays("Binance:BTC:1m", candles, indicators::SeriesVersion{1, 1});
    if (first != again || coordinator.computeCount() != 1) {
        std::cerr << "Unchanged version must reuse the cached overlay set\n";
        return false;
    }
    if (!first->ema99.values[98] || first->ema7.values.size() != candles.size() || !first->rsi14.values[14]) {
        std::cerr << "Overlay set incomplete\n";
        return false;
    }

    coordinator.getOverlays("Binance:BTC:1m", candles, indicators::SeriesVersion{1, 2});
    if (coordinator.computeCount() != 2) {
        std::cerr << "New version must recompute\n";
        return false;
    }
    coordinator.invalidateAll();
    coordinator.getOverlays("Binance:BTC:1m", candles, indicators::SeriesVersion{1, 2});
    if (coordinator.computeCount() != 3) {
        std::cerr << "Invalidated cache must recompute\n";
        return false;
    }
    return true;
}

}  // namespace

int main() {
    if (!checkEma() || !checkRsi() || !checkKdj() || !checkSar() || !checkCandleStats() || !checkCoordinatorCache()) {
        return 1;
    }
    std::cout << "indicator tests passed\n";
    return 0;
}
