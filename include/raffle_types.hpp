#pragma once

#include <cstdint>
#include <string>

#include "units.hpp"

namespace raffle {

using Address = std::string;
using RequestId = std::uint64_t;
using RandomWord = boost::multiprecision::uint256_t;
using Timestamp = std::uint64_t; // seconds since the epoch

enum class RaffleState {
    OPEN,
    CALCULATING
};

inline const char* toString(RaffleState state) {
    switch (state) {
    case RaffleState::OPEN:
        return "OPEN";
    case RaffleState::CALCULATING:
        return "CALCULATING";
    }
    return "UNKNOWN";
}

} // namespace raffle
