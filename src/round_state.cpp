#include "round_state.hpp"

#include "raffle_errors.hpp"

#include <stdexcept>

namespace raffle {

RoundStateMachine::RoundStateMachine(const RoundConfig& config, Timestamp deployedAt)
    : config_(config) {
    if (config_.entranceFee == 0) {
        throw std::invalid_argument("entrance fee must be positive");
    }
    if (config_.interval == 0) {
        throw std::invalid_argument("draw interval must be positive");
    }
    round_.lastDrawTimestamp = deployedAt;
}

void RoundStateMachine::enter(const Address& participant, const Wei& amount) {
    if (round_.state != RaffleState::OPEN) {
        throw RoundNotOpen(round_.state);
    }
    if (amount < config_.entranceFee) {
        throw InsufficientDeposit(amount, config_.entranceFee);
    }
    round_.ledger.add(participant, amount);
}

void RoundStateMachine::startCalculating() {
    if (round_.state != RaffleState::OPEN) {
        throw RoundNotOpen(round_.state);
    }
    round_.state = RaffleState::CALCULATING;
}

void RoundStateMachine::attachRequest(RequestId requestId) {
    if (round_.state != RaffleState::CALCULATING) {
        throw RoundNotCalculating(round_.state);
    }
    if (round_.pendingRequestId) {
        throw std::logic_error("a randomness request is already pending for this round");
    }
    round_.pendingRequestId = requestId;
}

void RoundStateMachine::requirePendingRequest(RequestId requestId) const {
    if (round_.state != RaffleState::CALCULATING) {
        throw RoundNotCalculating(round_.state);
    }
    if (!round_.pendingRequestId || *round_.pendingRequestId != requestId) {
        throw UnknownRequest(requestId);
    }
}

void RoundStateMachine::completeRound(const Address& winner, Timestamp now) {
    if (round_.state != RaffleState::CALCULATING) {
        throw RoundNotCalculating(round_.state);
    }
    round_.recentWinner = winner;
    round_.state = RaffleState::OPEN;
    round_.ledger.clear();
    round_.pendingRequestId.reset();
    round_.lastDrawTimestamp = now;
    ++round_.roundNumber;
}

} // namespace raffle
