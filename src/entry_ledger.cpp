#include "entry_ledger.hpp"

#include <limits>
#include <stdexcept>
#include <string>

namespace raffle {

void EntryLedger::add(const Address& participant, const Wei& amount) {
    if (participant.empty()) {
        throw std::invalid_argument("participant address must not be empty");
    }
    if (balance_ > std::numeric_limits<Wei>::max() - amount) {
        throw std::overflow_error("pool balance capacity exceeded");
    }
    participants_.push_back(participant);
    balance_ += amount;
}

void EntryLedger::clear() {
    participants_.clear();
    balance_ = 0;
}

const Address& EntryLedger::participantAt(std::size_t index) const {
    if (index >= participants_.size()) {
        throw std::out_of_range("participant index " + std::to_string(index) + " out of range (" +
                                std::to_string(participants_.size()) + " entries)");
    }
    return participants_[index];
}

} // namespace raffle
