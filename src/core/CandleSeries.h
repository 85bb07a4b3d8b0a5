#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <vector>

#include "domain/Types.h"

namespace core {

enum class MergeOutcome { ReplacedLast, Appended, Stale };

const char* to_string(MergeOutcome outcome);

// Bounded candle buffer for one (exchange, symbol, interval) session.
// Times are strictly increasing; every mutation bumps version().
// Not thread safe: owned and mutated on the session's executor.
class CandleSeries {
public:
    static constexpr std::size_t kDefaultCap = 500;

    explicit CandleSeries(std::size_t cap = kDefaultCap);

    // Keeps the newest cap() candles; rows that do not strictly increase in time are dropped.
    void replace_all(const std::vector<domain::Candle>& candles);

    // Same time as the last candle replaces it, a newer time appends (evicting the
    // oldest past cap()), an older time is ignored and reported Stale.
    MergeOutcome merge_one(const domain::Candle& candle);

    void clear();

    std::shared_ptr<const std::vector<domain::Candle>> snapshot() const;

    std::size_t size() const noexcept { return candles_.size(); }
    bool empty() const noexcept { return candles_.empty(); }
    std::size_t cap() const noexcept { return cap_; }
    std::uint64_t version() const noexcept { return version_; }

private:
    void touch_();

    std::size_t cap_;
    std::deque<domain::Candle> candles_;
    std::uint64_t version_ = 0;
    mutable std::shared_ptr<const std::vector<domain::Candle>> snapshot_;
};

}  // namespace core
