#pragma once

#include <cstdint>
#include <map>
#include <set>
#include <string>
#include <vector>

#include "gateways.hpp"
#include "raffle_types.hpp"

namespace raffle {

struct VrfKeyPair {
    std::string publicKeyHex;
    std::string secretKeyHex;
};

VrfKeyPair generateVrfKeypair();
VrfKeyPair deriveVrfKeypairFromSeed(const std::string& seedHex);

struct FulfillmentReceipt {
    RequestId requestId = 0;
    Address consumer;
    std::string alpha;
    std::string vrfProofHex;
    std::string vrfOutputHex;
    std::vector<RandomWord> randomWords;
    bool success = false;
    std::string failureReason;
};

// Development randomness gateway. Requests wait until fulfillRandomWords() is
// called for them; the words come from a libsodium VRF proof over the request,
// so anyone holding the public key can re-derive them.
class LocalVrfCoordinator : public RandomnessGateway {
public:
    static constexpr std::uint16_t kMaxRequestConfirmations = 200;
    static constexpr std::uint32_t kMaxCallbackGasLimit = 2'500'000;
    static constexpr std::uint32_t kMaxNumWords = 500;

    LocalVrfCoordinator(const VrfKeyPair& keys, std::string deploymentId, std::string chainId = {});
    ~LocalVrfCoordinator() override;

    LocalVrfCoordinator(const LocalVrfCoordinator&) = delete;
    LocalVrfCoordinator& operator=(const LocalVrfCoordinator&) = delete;

    std::uint64_t createSubscription();
    void addConsumer(std::uint64_t subscriptionId, const Address& consumer);
    void removeConsumer(std::uint64_t subscriptionId, const Address& consumer);
    bool consumerIsAdded(std::uint64_t subscriptionId, const Address& consumer) const;

    RequestId requestRandomWords(const RandomWordsRequest& request,
                                 RandomnessConsumer& consumer) override;

    // Both consume the request whether or not the consumer accepts the words;
    // a consumer failure is reported in the receipt.
    FulfillmentReceipt fulfillRandomWords(RequestId requestId);
    FulfillmentReceipt fulfillRandomWordsWithOverride(RequestId requestId,
                                                      std::vector<RandomWord> randomWords);

    bool isPending(RequestId requestId) const { return pending_.count(requestId) != 0; }
    std::vector<RequestId> pendingRequests() const;
    const std::string& getPublicKey() const { return publicKeyHex_; }
    const std::string& getDeploymentId() const { return deploymentId_; }
    const std::string& getChainId() const { return chainId_; }

    static std::string buildAlpha(const std::string& deploymentId,
                                  const std::string& chainId,
                                  const std::string& keyHash,
                                  const Address& consumer,
                                  std::uint64_t subscriptionId,
                                  RequestId requestId);
    static bool verifyProof(const std::string& vrfProofHex,
                            const std::string& vrfOutputHex,
                            const std::string& publicKeyHex,
                            const std::string& alpha);
    static std::vector<RandomWord> deriveRandomWords(const std::string& vrfOutputHex,
                                                     RequestId requestId,
                                                     std::uint32_t numWords);

private:
    struct PendingRequest {
        RandomnessConsumer* consumer = nullptr;
        Address consumerAddress;
        RandomWordsRequest request;
    };

    PendingRequest takePending(RequestId requestId);
    FulfillmentReceipt deliver(const PendingRequest& pending, FulfillmentReceipt receipt);

    std::string deploymentId_;
    std::string chainId_;
    std::string publicKeyHex_;
    std::vector<unsigned char> secretKey_;

    std::uint64_t nextSubscriptionId_ = 1;
    RequestId nextRequestId_ = 1;
    std::map<std::uint64_t, std::set<Address>> subscriptions_;
    std::map<RequestId, PendingRequest> pending_;
};

} // namespace raffle
