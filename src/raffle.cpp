#include "raffle.hpp"

#include "raffle_errors.hpp"

#include <stdexcept>
#include <utility>

namespace raffle {

namespace {

RandomWordsRequest buildRequestTemplate(const RaffleConfig& cfg) {
    RandomWordsRequest request;
    request.keyHash = cfg.keyHash;
    request.subscriptionId = cfg.subscriptionId;
    request.requestConfirmations = kRequestConfirmations;
    request.callbackGasLimit = cfg.callbackGasLimit;
    request.numWords = kNumWords;
    return request;
}

const RaffleConfig& validated(const RaffleConfig& cfg) {
    validateRaffleConfig(cfg);
    return cfg;
}

} // namespace

Raffle::Raffle(const RaffleConfig& config,
               Address self,
               RandomnessGateway& gateway,
               ValueTransfer& transfer,
               const Clock& clock)
    : config_(validated(config))
    , self_(std::move(self))
    , clock_(clock)
    , transfer_(transfer)
    , round_(RoundConfig{ config_.entranceFee, config_.interval }, clock.now())
    , events_()
    , coordinator_(self_, round_, gateway, transfer, clock, events_, buildRequestTemplate(config_)) {}

void Raffle::enterRaffle(const Address& player, const Wei& value) {
    Round before = round_.snapshot();
    round_.enter(player, value);

    bool paid = false;
    try {
        paid = transfer_.send(player, self_, value);
    } catch (const std::exception&) {
        round_.restore(std::move(before));
        throw;
    }
    if (!paid) {
        round_.restore(std::move(before));
        throw DepositFailed(player, value);
    }

    events_.append(RaffleEvent::raffleEnter(player, value, round_.getRoundNumber()));
}

UpkeepCheck Raffle::inspectUpkeep() const {
    return evaluateUpkeep(round_, clock_.now());
}

UpkeepResult Raffle::checkUpkeep(const std::string& /*checkData*/) const {
    UpkeepResult result;
    result.upkeepNeeded = inspectUpkeep().upkeepNeeded;
    return result;
}

void Raffle::performUpkeep(const std::string& /*performData*/) {
    coordinator_.requestDraw();
}

Address Raffle::getRecentWinner() const {
    const auto& winner = round_.getRecentWinner();
    return winner ? *winner : Address{};
}

} // namespace raffle
