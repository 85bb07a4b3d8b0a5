#pragma once

#include <cstdint>

namespace app {

using CancellationToken = std::uint64_t;

// Hands out strictly increasing tokens; only the latest one is current.
class CancellationSource {
public:
    CancellationToken mint() noexcept { return ++current_; }

    bool is_current(CancellationToken token) const noexcept { return token == current_; }

    CancellationToken current() const noexcept { return current_; }

private:
    CancellationToken current_ = 0;
};

}  // namespace app
