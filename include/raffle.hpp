#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

#include "clock.hpp"
#include "draw_coordinator.hpp"
#include "event_log.hpp"
#include "gateways.hpp"
#include "raffle_config.hpp"
#include "round_state.hpp"
#include "upkeep.hpp"
#include "value_transfer.hpp"

namespace raffle {

constexpr std::uint16_t kRequestConfirmations = 3;
constexpr std::uint32_t kNumWords = 1;

// One raffle deployment. Owns the round; borrows its gateway, value transport
// and clock, which must outlive it. Entry fees are moved from the player to the
// raffle's own address and the prize is paid from there, so the raffle's balance
// on the transport tracks the pool. Not thread-safe: callers serialize access.
class Raffle : public AutomationCompatible {
public:
    Raffle(const RaffleConfig& config,
           Address self,
           RandomnessGateway& gateway,
           ValueTransfer& transfer,
           const Clock& clock);

    Raffle(const Raffle&) = delete;
    Raffle& operator=(const Raffle&) = delete;

    void enterRaffle(const Address& player, const Wei& value);

    UpkeepResult checkUpkeep(const std::string& checkData) const override;
    void performUpkeep(const std::string& performData) override;
    UpkeepCheck inspectUpkeep() const;

    // The callback channel to register with the randomness gateway.
    RandomnessConsumer& consumer() { return coordinator_; }

    const Address& getAddress() const { return self_; }
    const Wei& getEntranceFee() const { return round_.getEntranceFee(); }
    const Address& getPlayer(std::size_t index) const { return round_.getPlayer(index); }
    Address getRecentWinner() const;
    RaffleState getRaffleState() const { return round_.getState(); }
    std::size_t getNumberOfPlayers() const { return round_.getNumberOfPlayers(); }
    Timestamp getLatestTimestamp() const { return round_.getLastDrawTimestamp(); }
    std::uint64_t getInterval() const { return round_.getInterval(); }
    std::uint16_t getRequestConfirmations() const { return kRequestConfirmations; }
    std::uint32_t getNumWords() const { return kNumWords; }
    const Wei& getPoolBalance() const { return round_.getPoolBalance(); }
    std::optional<RequestId> getPendingRequestId() const { return round_.getPendingRequestId(); }
    std::uint64_t getRoundNumber() const { return round_.getRoundNumber(); }
    const RaffleConfig& getConfig() const { return config_; }
    const EventLog& getEvents() const { return events_; }

private:
    RaffleConfig config_;
    Address self_;
    const Clock& clock_;
    ValueTransfer& transfer_;
    RoundStateMachine round_;
    EventLog events_;
    DrawCoordinator coordinator_;
};

} // namespace raffle
