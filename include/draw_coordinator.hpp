#pragma once

#include <cstddef>
#include <vector>

#include "clock.hpp"
#include "event_log.hpp"
#include "gateways.hpp"
#include "round_state.hpp"
#include "value_transfer.hpp"

namespace raffle {

// Two-phase draw: requestDraw() moves the round to CALCULATING and asks the
// gateway for randomness; the gateway later calls rawFulfillRandomWords(),
// which picks the winner, resets the round and pays out.
//
// Payout runs after the reset so a re-entrant recipient finds an empty OPEN
// round. If the payout fails, the round and the event log are restored to their
// state before the callback and PayoutFailed is thrown; the round then stays
// CALCULATING with nothing retried.
class DrawCoordinator : public RandomnessConsumer {
public:
    DrawCoordinator(Address self,
                    RoundStateMachine& round,
                    RandomnessGateway& gateway,
                    ValueTransfer& transfer,
                    const Clock& clock,
                    EventLog& events,
                    RandomWordsRequest requestTemplate);

    DrawCoordinator(const DrawCoordinator&) = delete;
    DrawCoordinator& operator=(const DrawCoordinator&) = delete;

    RequestId requestDraw();

    Address consumerAddress() const override { return self_; }
    void rawFulfillRandomWords(const RandomnessGateway& from,
                               RequestId requestId,
                               const std::vector<RandomWord>& randomWords) override;

    const RandomWordsRequest& getRequestTemplate() const { return requestTemplate_; }

    // word mod numPlayers. Not uniform unless numPlayers divides 2^256; accepted.
    static std::size_t selectWinnerIndex(const RandomWord& word, std::size_t numPlayers);

private:
    void fulfill(RequestId requestId, const std::vector<RandomWord>& randomWords);

    Address self_;
    RoundStateMachine& round_;
    RandomnessGateway& gateway_;
    ValueTransfer& transfer_;
    const Clock& clock_;
    EventLog& events_;
    RandomWordsRequest requestTemplate_;
};

} // namespace raffle
