#include "indicators/IndicatorCoordinator.h"

#include "indicators/IndicatorEngine.h"
#include "logging/Log.h"

#include <utility>

namespace indicators {

namespace {

constexpr EmaParams kEmaFast{7};
constexpr EmaParams kEmaMid{25};
constexpr EmaParams kEmaSlow{99};
constexpr RsiParams kRsi{14};
constexpr KdjParams kKdj{9};
constexpr SarParams kSar{0.02, 0.2};

} // namespace

IndicatorSet IndicatorCoordinator::computeOverlays(const std::vector<domain::Candle>& candles) {
    IndicatorSet set;
    set.ema7 = IndicatorEngine::computeEMA(candles, kEmaFast);
    set.ema25 = IndicatorEngine::computeEMA(candles, kEmaMid);
    set.ema99 = IndicatorEngine::computeEMA(candles, kEmaSlow);
    set.rsi14 = IndicatorEngine::computeRSI(candles, kRsi);
    set.kdj9 = IndicatorEngine::computeKDJ(candles, kKdj);
    set.sar = IndicatorEngine::computeSAR(candles, kSar);
    set.trend = IndicatorEngine::trendFromSar(candles, set.sar);
    return set;
}

std::shared_ptr<const IndicatorSet> IndicatorCoordinator::getOverlays(const std::string& seriesId,
                                                                      const std::vector<domain::Candle>& candles,
                                                                      const SeriesVersion& version) {
    {
        std::lock_guard<std::mutex> lock(mtx_);
        auto it = cache_.find(seriesId);
        if (it != cache_.end() && it->second.version == version && it->second.set) {
            LOG_TRACE(logging::LogCategory::INDICATOR,
                      "Overlay cache hit for %s revision=%llu",
                      seriesId.c_str(),
                      static_cast<unsigned long long>(version.revision));
            return it->second.set;
        }
    }

    auto computed = std::make_shared<const IndicatorSet>(computeOverlays(candles));

    {
        std::lock_guard<std::mutex> lock(mtx_);
        cache_[seriesId] = CachedIndicatorSet{version, computed};
        ++computeCount_;
    }

    LOG_DEBUG(logging::LogCategory::INDICATOR,
              "Overlay compute for %s revision=%llu candles=%zu",
              seriesId.c_str(),
              static_cast<unsigned long long>(version.revision),
              candles.size());
    return computed;
}

void IndicatorCoordinator::invalidate(const std::string& seriesId) {
    std::lock_guard<std::mutex> lock(mtx_);
    cache_.erase(seriesId);
}

void IndicatorCoordinator::invalidateAll() {
    std::lock_guard<std::mutex> lock(mtx_);
    cache_.clear();
}

std::size_t IndicatorCoordinator::computeCount() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return computeCount_;
}

}  // namespace indicators
