#pragma once

#include <cstddef>
#include <vector>

#include "raffle_types.hpp"

namespace raffle {

// Participants of the current round in entry order, plus the total they paid in.
class EntryLedger {
public:
    void add(const Address& participant, const Wei& amount);
    void clear();

    const Address& participantAt(std::size_t index) const;
    const std::vector<Address>& participants() const { return participants_; }
    std::size_t size() const { return participants_.size(); }
    bool empty() const { return participants_.empty(); }
    const Wei& balance() const { return balance_; }

private:
    std::vector<Address> participants_;
    Wei balance_;
};

} // namespace raffle
