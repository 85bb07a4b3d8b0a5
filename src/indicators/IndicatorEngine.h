#pragma once

#include <cstddef>
#include <optional>
#include <vector>

#include "domain/Types.h"
#include "indicators/IndicatorTypes.h"

namespace indicators {

// Batch indicator math over an ordered candle sequence. Every output has one
// entry per input candle; undefined entries are std::nullopt.
class IndicatorEngine {
public:
    using Candles = std::vector<domain::Candle>;

    static IndicatorSeries computeEMA(const Candles& candles, const EmaParams& params);

    // Wilder smoothing. Exactly 100 while the average loss is zero.
    static IndicatorSeries computeRSI(const Candles& candles, const RsiParams& params);

    static KdjSeries computeKDJ(const Candles& candles, const KdjParams& params);

    // Fewer than five candles yields all nulls.
    static SarSeries computeSAR(const Candles& candles, const SarParams& params);

    static std::optional<Trend> trendFromSar(const Candles& candles, const SarSeries& sar);

    // Relative to the previous close; the first candle is measured against its own open.
    static std::optional<CandleStats> candleStats(const Candles& candles, std::size_t index);
};

}  // namespace indicators
