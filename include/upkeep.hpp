#pragma once

#include <cstddef>
#include <cstdint>

#include "raffle_types.hpp"
#include "round_state.hpp"

namespace raffle {

struct UpkeepCheck {
    bool upkeepNeeded = false;
    bool isOpen = false;
    bool timePassed = false;
    bool hasPlayers = false;
    bool hasBalance = false;

    RaffleState state = RaffleState::OPEN;
    std::size_t numPlayers = 0;
    Wei balance;
};

// Strictly more than `interval` seconds since the last draw. A clock that reads
// earlier than the last draw never counts as elapsed.
bool intervalElapsed(Timestamp lastDraw, Timestamp now, std::uint64_t interval);

// Read-only; safe to call at any time.
UpkeepCheck evaluateUpkeep(const RoundStateMachine& round, Timestamp now);

} // namespace raffle
