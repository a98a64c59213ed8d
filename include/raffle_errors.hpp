#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

#include "raffle_types.hpp"

namespace raffle {

class RaffleError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class InsufficientDeposit : public RaffleError {
public:
    InsufficientDeposit(const Wei& sent, const Wei& required);

    const Wei& getSent() const { return sent_; }
    const Wei& getRequired() const { return required_; }

private:
    Wei sent_;
    Wei required_;
};

// The entrant's funds could not be moved into the raffle.
class DepositFailed : public RaffleError {
public:
    DepositFailed(Address player, const Wei& amount);

    const Address& getPlayer() const { return player_; }
    const Wei& getAmount() const { return amount_; }

private:
    Address player_;
    Wei amount_;
};

class RoundNotOpen : public RaffleError {
public:
    explicit RoundNotOpen(RaffleState state);

    RaffleState getState() const { return state_; }

private:
    RaffleState state_;
};

// Carries the snapshot the draw request was rejected on.
class UpkeepNotNeeded : public RaffleError {
public:
    UpkeepNotNeeded(const Wei& balance, std::size_t numPlayers, RaffleState state);

    const Wei& getBalance() const { return balance_; }
    std::size_t getNumPlayers() const { return numPlayers_; }
    RaffleState getState() const { return state_; }

private:
    Wei balance_;
    std::size_t numPlayers_;
    RaffleState state_;
};

class PayoutFailed : public RaffleError {
public:
    PayoutFailed(Address winner, const Wei& amount, const std::string& reason);

    const Address& getWinner() const { return winner_; }
    const Wei& getAmount() const { return amount_; }

private:
    Address winner_;
    Wei amount_;
};

class RoundNotCalculating : public RaffleError {
public:
    explicit RoundNotCalculating(RaffleState state);
};

class UnknownRequest : public RaffleError {
public:
    explicit UnknownRequest(RequestId requestId);

    RequestId getRequestId() const { return requestId_; }

private:
    RequestId requestId_;
};

class OnlyCoordinatorCanFulfill : public RaffleError {
public:
    OnlyCoordinatorCanFulfill();
};

class InvalidSubscription : public RaffleError {
public:
    explicit InvalidSubscription(std::uint64_t subscriptionId);
};

class InvalidConsumer : public RaffleError {
public:
    InvalidConsumer(std::uint64_t subscriptionId, const Address& consumer);
};

class InvalidRandomnessRequest : public RaffleError {
public:
    using RaffleError::RaffleError;
};

} // namespace raffle
