#include "clock.hpp"

#include <chrono>
#include <limits>
#include <stdexcept>

namespace raffle {

Timestamp SystemClock::now() const {
    auto since = std::chrono::system_clock::now().time_since_epoch();
    auto seconds = std::chrono::duration_cast<std::chrono::seconds>(since).count();
    return seconds < 0 ? 0 : static_cast<Timestamp>(seconds);
}

ManualClock::ManualClock(Timestamp start)
    : now_(start) {}

void ManualClock::advance(std::uint64_t seconds) {
    if (now_ > std::numeric_limits<Timestamp>::max() - seconds) {
        throw std::overflow_error("ManualClock advanced past the end of time");
    }
    now_ += seconds;
}

} // namespace raffle
