#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "raffle_types.hpp"

namespace raffle {

enum class EventKind : std::uint8_t {
    RAFFLE_ENTER = 1,
    REQUESTED_RAFFLE_WINNER = 2,
    WINNER_PICKED = 3
};

const char* toString(EventKind kind);

struct RaffleEvent {
    EventKind kind = EventKind::RAFFLE_ENTER;
    Address account;
    Wei amount;
    RequestId requestId = 0;
    std::uint64_t round = 0;

    static RaffleEvent raffleEnter(const Address& player, const Wei& amount, std::uint64_t round);
    static RaffleEvent requestedRaffleWinner(RequestId requestId, std::uint64_t round);
    static RaffleEvent winnerPicked(const Address& winner, const Wei& amount, std::uint64_t round);
};

// | kind u8 | round u64 | requestId u64 | amount 32 bytes | len-prefixed account |
// All integers little-endian.
std::string encodeEvent(const RaffleEvent& event);

// Append-only notification log for off-chain observers. Leaves are SHA-256 of
// the encoded event; the root commits to the whole history.
class EventLog {
public:
    void append(const RaffleEvent& event);
    void truncate(std::size_t size);

    const std::vector<RaffleEvent>& events() const { return events_; }
    std::size_t size() const { return events_.size(); }
    std::size_t countOf(EventKind kind) const;
    const RaffleEvent& back() const;

    std::string getLeaf(std::size_t index) const;
    std::string merkleRoot() const;
    std::vector<std::string> merkleProof(std::size_t leafIndex) const;

    static bool verifyMerkleProof(const std::string& leaf,
                                  std::size_t leafIndex,
                                  const std::vector<std::string>& proof,
                                  const std::string& root);

private:
    static std::string hash(const std::string& data);
    static std::string hashPair(const std::string& left, const std::string& right);

    std::vector<RaffleEvent> events_;
    std::vector<std::string> leaves_;
};

} // namespace raffle
