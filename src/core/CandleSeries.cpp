#include "core/CandleSeries.h"

#include <stdexcept>

namespace core {

const char* to_string(MergeOutcome outcome) {
    switch (outcome) {
    case MergeOutcome::ReplacedLast:
        return "replaced_last";
    case MergeOutcome::Appended:
        return "appended";
    case MergeOutcome::Stale:
        return "stale";
    }
    return "unknown";
}

CandleSeries::CandleSeries(std::size_t cap)
    : cap_(cap) {
    if (cap_ == 0) {
        throw std::invalid_argument("CandleSeries cap must be positive");
    }
}

void CandleSeries::replace_all(const std::vector<domain::Candle>& candles) {
    std::deque<domain::Candle> next;
    for (const auto& candle : candles) {
        if (!next.empty() && candle.time <= next.back().time) {
            continue;
        }
        next.push_back(candle);
        if (next.size() > cap_) {
            next.pop_front();
        }
    }
    candles_.swap(next);
    touch_();
}

MergeOutcome CandleSeries::merge_one(const domain::Candle& candle) {
    if (!candles_.empty()) {
        auto& last = candles_.back();
        if (candle.time == last.time) {
            last = candle;
            touch_();
            return MergeOutcome::ReplacedLast;
        }
        if (candle.time < last.time) {
            return MergeOutcome::Stale;
        }
    }

    candles_.push_back(candle);
    if (candles_.size() > cap_) {
        candles_.pop_front();
    }
    touch_();
    return MergeOutcome::Appended;
}

void CandleSeries::clear() {
    candles_.clear();
    touch_();
}

std::shared_ptr<const std::vector<domain::Candle>> CandleSeries::snapshot() const {
    if (!snapshot_) {
        snapshot_ = std::make_shared<const std::vector<domain::Candle>>(candles_.begin(), candles_.end());
    }
    return snapshot_;
}

void CandleSeries::touch_() {
    ++version_;
    snapshot_.reset();
}

}  // namespace core
