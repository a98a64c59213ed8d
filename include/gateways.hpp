#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "raffle_types.hpp"

namespace raffle {

struct RandomWordsRequest {
    std::string keyHash;
    std::uint64_t subscriptionId = 0;
    std::uint16_t requestConfirmations = 0;
    std::uint32_t callbackGasLimit = 0;
    std::uint32_t numWords = 0;
};

class RandomnessGateway;

// Receiving end of a randomness request. Gateways hand themselves in as `from`
// so the consumer can refuse callbacks from anyone but the gateway it used.
class RandomnessConsumer {
public:
    virtual ~RandomnessConsumer() = default;
    virtual Address consumerAddress() const = 0;
    virtual void rawFulfillRandomWords(const RandomnessGateway& from,
                                       RequestId requestId,
                                       const std::vector<RandomWord>& randomWords) = 0;
};

// Asynchronous: returns an id now, delivers words through the consumer later.
class RandomnessGateway {
public:
    virtual ~RandomnessGateway() = default;
    virtual RequestId requestRandomWords(const RandomWordsRequest& request,
                                         RandomnessConsumer& consumer) = 0;
};

struct UpkeepResult {
    bool upkeepNeeded = false;
    std::string performData;
};

// Check/perform surface polled by the automation network.
class AutomationCompatible {
public:
    virtual ~AutomationCompatible() = default;
    virtual UpkeepResult checkUpkeep(const std::string& checkData) const = 0;
    virtual void performUpkeep(const std::string& performData) = 0;
};

} // namespace raffle
