#include "draw_coordinator.hpp"

#include "raffle_errors.hpp"
#include "upkeep.hpp"

#include <stdexcept>
#include <utility>

namespace raffle {

DrawCoordinator::DrawCoordinator(Address self,
                                 RoundStateMachine& round,
                                 RandomnessGateway& gateway,
                                 ValueTransfer& transfer,
                                 const Clock& clock,
                                 EventLog& events,
                                 RandomWordsRequest requestTemplate)
    : self_(std::move(self))
    , round_(round)
    , gateway_(gateway)
    , transfer_(transfer)
    , clock_(clock)
    , events_(events)
    , requestTemplate_(std::move(requestTemplate)) {
    if (self_.empty()) {
        throw std::invalid_argument("draw coordinator needs the raffle address");
    }
    if (requestTemplate_.numWords == 0) {
        throw std::invalid_argument("randomness request must ask for at least one word");
    }
}

std::size_t DrawCoordinator::selectWinnerIndex(const RandomWord& word, std::size_t numPlayers) {
    if (numPlayers == 0) {
        throw std::logic_error("cannot pick a winner from an empty round");
    }
    RandomWord index = word % RandomWord(numPlayers);
    return static_cast<std::size_t>(index);
}

RequestId DrawCoordinator::requestDraw() {
    UpkeepCheck check = evaluateUpkeep(round_, clock_.now());
    if (!check.upkeepNeeded) {
        throw UpkeepNotNeeded(check.balance, check.numPlayers, check.state);
    }

    Round before = round_.snapshot();
    round_.startCalculating();

    RequestId requestId = 0;
    try {
        requestId = gateway_.requestRandomWords(requestTemplate_, *this);
    } catch (const std::exception&) {
        round_.restore(std::move(before));
        throw;
    }

    round_.attachRequest(requestId);
    events_.append(RaffleEvent::requestedRaffleWinner(requestId, round_.getRoundNumber()));
    return requestId;
}

void DrawCoordinator::rawFulfillRandomWords(const RandomnessGateway& from,
                                            RequestId requestId,
                                            const std::vector<RandomWord>& randomWords) {
    if (&from != &gateway_) {
        throw OnlyCoordinatorCanFulfill();
    }
    fulfill(requestId, randomWords);
}

void DrawCoordinator::fulfill(RequestId requestId, const std::vector<RandomWord>& randomWords) {
    round_.requirePendingRequest(requestId);
    if (randomWords.empty()) {
        throw std::invalid_argument("fulfillment carried no random words");
    }

    const std::size_t winnerIndex =
        selectWinnerIndex(randomWords.front(), round_.getNumberOfPlayers());
    const Address winner = round_.getPlayer(winnerIndex);
    const Wei prize = round_.getPoolBalance();

    Round before = round_.snapshot();
    const std::size_t eventMark = events_.size();

    round_.completeRound(winner, clock_.now());
    events_.append(RaffleEvent::winnerPicked(winner, prize, before.roundNumber));

    bool sent = false;
    try {
        sent = transfer_.send(self_, winner, prize);
    } catch (const std::exception& ex) {
        round_.restore(std::move(before));
        events_.truncate(eventMark);
        throw PayoutFailed(winner, prize, ex.what());
    }
    if (!sent) {
        round_.restore(std::move(before));
        events_.truncate(eventMark);
        throw PayoutFailed(winner, prize, "recipient rejected the transfer");
    }
}

} // namespace raffle
