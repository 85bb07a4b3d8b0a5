#pragma once

#include "domain/Types.h"
#include "indicators/IndicatorTypes.h"

#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace indicators {

struct CachedIndicatorSet {
    SeriesVersion version;
    std::shared_ptr<const IndicatorSet> set;
};

// Computes the standard overlay set for a candle series and keeps the result
// until the series version changes.
class IndicatorCoordinator {
public:
    IndicatorCoordinator() = default;

    std::shared_ptr<const IndicatorSet> getOverlays(const std::string& seriesId,
                                                    const std::vector<domain::Candle>& candles,
                                                    const SeriesVersion& version);

    void invalidate(const std::string& seriesId);
    void invalidateAll();

    // Full recomputations performed so far.
    std::size_t computeCount() const;

    static IndicatorSet computeOverlays(const std::vector<domain::Candle>& candles);

private:
    std::unordered_map<std::string, CachedIndicatorSet> cache_;
    std::size_t computeCount_ = 0;
    mutable std::mutex mtx_;
};

}  // namespace indicators
