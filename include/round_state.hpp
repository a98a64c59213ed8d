#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <utility>

#include "entry_ledger.hpp"
#include "raffle_types.hpp"

namespace raffle {

struct RoundConfig {
    Wei entranceFee;
    std::uint64_t interval = 0; // seconds between draws
};

// Everything that changes over the life of the raffle. Copied whole for rollback.
struct Round {
    RaffleState state = RaffleState::OPEN;
    Timestamp lastDrawTimestamp = 0;
    std::optional<RequestId> pendingRequestId;
    std::optional<Address> recentWinner;
    std::uint64_t roundNumber = 0;
    EntryLedger ledger;
};

class RoundStateMachine {
public:
    RoundStateMachine(const RoundConfig& config, Timestamp deployedAt);

    // OPEN only; amount >= entrance fee. The whole amount joins the pool.
    void enter(const Address& participant, const Wei& amount);

    // OPEN -> CALCULATING. The request id is attached once the gateway issued one.
    void startCalculating();
    void attachRequest(RequestId requestId);

    // Throws unless a draw is in flight under exactly this request id.
    void requirePendingRequest(RequestId requestId) const;

    // CALCULATING -> OPEN with the winner recorded and the ledger emptied.
    void completeRound(const Address& winner, Timestamp now);

    Round snapshot() const { return round_; }
    void restore(Round saved) { round_ = std::move(saved); }

    const RoundConfig& getConfig() const { return config_; }
    const Wei& getEntranceFee() const { return config_.entranceFee; }
    std::uint64_t getInterval() const { return config_.interval; }
    RaffleState getState() const { return round_.state; }
    Timestamp getLastDrawTimestamp() const { return round_.lastDrawTimestamp; }
    const std::optional<RequestId>& getPendingRequestId() const { return round_.pendingRequestId; }
    const std::optional<Address>& getRecentWinner() const { return round_.recentWinner; }
    std::uint64_t getRoundNumber() const { return round_.roundNumber; }
    const EntryLedger& getLedger() const { return round_.ledger; }
    const Address& getPlayer(std::size_t index) const { return round_.ledger.participantAt(index); }
    std::size_t getNumberOfPlayers() const { return round_.ledger.size(); }
    const Wei& getPoolBalance() const { return round_.ledger.balance(); }

private:
    const RoundConfig config_;
    Round round_;
};

} // namespace raffle
