#include "upkeep.hpp"

namespace raffle {

bool intervalElapsed(Timestamp lastDraw, Timestamp now, std::uint64_t interval) {
    if (now < lastDraw) {
        return false;
    }
    return now - lastDraw > interval;
}

UpkeepCheck evaluateUpkeep(const RoundStateMachine& round, Timestamp now) {
    UpkeepCheck check;
    check.state = round.getState();
    check.numPlayers = round.getNumberOfPlayers();
    check.balance = round.getPoolBalance();

    check.isOpen = check.state == RaffleState::OPEN;
    check.timePassed = intervalElapsed(round.getLastDrawTimestamp(), now, round.getInterval());
    check.hasPlayers = check.numPlayers > 0;
    check.hasBalance = check.balance > 0;
    check.upkeepNeeded = check.isOpen && check.timePassed && check.hasPlayers && check.hasBalance;
    return check;
}

} // namespace raffle
