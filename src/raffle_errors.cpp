#include "raffle_errors.hpp"

#include <sstream>
#include <utility>

namespace raffle {

namespace {

std::string describeDeposit(const Wei& sent, const Wei& required) {
    std::ostringstream oss;
    oss << "Raffle__NotEnoughETHEntered: sent " << formatEther(sent) << " ether, entrance fee is "
        << formatEther(required) << " ether";
    return oss.str();
}

std::string describeUpkeep(const Wei& balance, std::size_t numPlayers, RaffleState state) {
    std::ostringstream oss;
    oss << "Raffle__UpkeepNotNeeded: balance=" << formatWei(balance) << " players=" << numPlayers
        << " state=" << toString(state);
    return oss.str();
}

} // namespace

InsufficientDeposit::InsufficientDeposit(const Wei& sent, const Wei& required)
    : RaffleError(describeDeposit(sent, required))
    , sent_(sent)
    , required_(required) {}

DepositFailed::DepositFailed(Address player, const Wei& amount)
    : RaffleError("Raffle__DepositFailed: " + player + " could not pay " + formatEther(amount) + " ether")
    , player_(std::move(player))
    , amount_(amount) {}

RoundNotOpen::RoundNotOpen(RaffleState state)
    : RaffleError(std::string("Raffle__NotOpen: round is ") + toString(state))
    , state_(state) {}

UpkeepNotNeeded::UpkeepNotNeeded(const Wei& balance, std::size_t numPlayers, RaffleState state)
    : RaffleError(describeUpkeep(balance, numPlayers, state))
    , balance_(balance)
    , numPlayers_(numPlayers)
    , state_(state) {}

PayoutFailed::PayoutFailed(Address winner, const Wei& amount, const std::string& reason)
    : RaffleError("Raffle__TransferFailed: paying " + formatEther(amount) + " ether to " + winner +
                  " failed: " + reason)
    , winner_(std::move(winner))
    , amount_(amount) {}

RoundNotCalculating::RoundNotCalculating(RaffleState state)
    : RaffleError(std::string("no draw in flight: round is ") + toString(state)) {}

UnknownRequest::UnknownRequest(RequestId requestId)
    : RaffleError("nonexistent request: " + std::to_string(requestId))
    , requestId_(requestId) {}

OnlyCoordinatorCanFulfill::OnlyCoordinatorCanFulfill()
    : RaffleError("OnlyCoordinatorCanFulfill: callback did not come from the registered gateway") {}

InvalidSubscription::InvalidSubscription(std::uint64_t subscriptionId)
    : RaffleError("InvalidSubscription: " + std::to_string(subscriptionId)) {}

InvalidConsumer::InvalidConsumer(std::uint64_t subscriptionId, const Address& consumer)
    : RaffleError("InvalidConsumer: " + consumer + " is not registered on subscription " +
                  std::to_string(subscriptionId)) {}

} // namespace raffle
