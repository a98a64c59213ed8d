#include "vrf_coordinator.hpp"

#include "encoding.hpp"
#include "picosha2.h"
#include "raffle_errors.hpp"

#include <algorithm>
#include <array>
#include <sstream>
#include <stdexcept>
#include <string_view>
#include <utility>

#include <sodium.h>

namespace raffle {

#ifndef crypto_vrf_PROOFBYTES
#error "libsodium must provide crypto_vrf_* support (version >= 1.0.18)"
#endif

namespace {

bool ensureSodiumReady() {
    static bool ready = sodium_init() >= 0;
    return ready;
}

std::string buildDeploymentScope(const std::string& deploymentId, const std::string& chainId) {
    if (deploymentId.empty()) {
        throw std::invalid_argument("deploymentId must not be empty for VRF domain separation");
    }
    if (chainId.empty()) {
        return deploymentId;
    }
    return deploymentId + "|" + chainId;
}

VrfKeyPair exportKeypair(const std::vector<unsigned char>& publicKey, std::vector<unsigned char>& secretKey) {
    VrfKeyPair pair{
        bytesToHex(publicKey.data(), publicKey.size()),
        bytesToHex(secretKey.data(), secretKey.size()),
    };
    sodium_memzero(secretKey.data(), secretKey.size());
    return pair;
}

constexpr std::string_view kVrfDomainTag = "entropy-raffle:vrf:v1";

} // namespace

VrfKeyPair generateVrfKeypair() {
    if (!ensureSodiumReady()) {
        throw std::runtime_error("Unable to initialize libsodium");
    }

    std::vector<unsigned char> publicKey(crypto_vrf_PUBLICKEYBYTES);
    std::vector<unsigned char> secretKey(crypto_vrf_SECRETKEYBYTES);
    if (crypto_vrf_keypair(publicKey.data(), secretKey.data()) != 0) {
        throw std::runtime_error("VRF key generation failed");
    }
    return exportKeypair(publicKey, secretKey);
}

VrfKeyPair deriveVrfKeypairFromSeed(const std::string& seedHex) {
    if (!ensureSodiumReady()) {
        throw std::runtime_error("Unable to initialize libsodium");
    }

    auto seed = hexToBytes(seedHex);
    if (seed.size() != crypto_vrf_SEEDBYTES) {
        throw std::invalid_argument("Seed must decode to crypto_vrf_SEEDBYTES bytes");
    }

    std::vector<unsigned char> publicKey(crypto_vrf_PUBLICKEYBYTES);
    std::vector<unsigned char> secretKey(crypto_vrf_SECRETKEYBYTES);
    if (crypto_vrf_keypair_from_seed(publicKey.data(), secretKey.data(), seed.data()) != 0) {
        sodium_memzero(seed.data(), seed.size());
        throw std::runtime_error("Failed to derive VRF keypair from seed");
    }
    sodium_memzero(seed.data(), seed.size());
    return exportKeypair(publicKey, secretKey);
}

LocalVrfCoordinator::LocalVrfCoordinator(const VrfKeyPair& keys, std::string deploymentId, std::string chainId)
    : deploymentId_(std::move(deploymentId))
    , chainId_(std::move(chainId))
    , publicKeyHex_(keys.publicKeyHex) {
    if (!ensureSodiumReady()) {
        throw std::runtime_error("Unable to initialize libsodium");
    }
    (void)buildDeploymentScope(deploymentId_, chainId_);

    secretKey_ = hexToBytes(keys.secretKeyHex);
    if (secretKey_.size() != crypto_vrf_SECRETKEYBYTES) {
        sodium_memzero(secretKey_.data(), secretKey_.size());
        throw std::invalid_argument("VRF secret key length invalid");
    }
    if (hexToBytes(publicKeyHex_).size() != crypto_vrf_PUBLICKEYBYTES) {
        throw std::invalid_argument("VRF public key length invalid");
    }
}

LocalVrfCoordinator::~LocalVrfCoordinator() {
    sodium_memzero(secretKey_.data(), secretKey_.size());
}

std::uint64_t LocalVrfCoordinator::createSubscription() {
    std::uint64_t id = nextSubscriptionId_++;
    subscriptions_[id];
    return id;
}

void LocalVrfCoordinator::addConsumer(std::uint64_t subscriptionId, const Address& consumer) {
    auto it = subscriptions_.find(subscriptionId);
    if (it == subscriptions_.end()) {
        throw InvalidSubscription(subscriptionId);
    }
    if (consumer.empty()) {
        throw std::invalid_argument("consumer address must not be empty");
    }
    it->second.insert(consumer);
}

void LocalVrfCoordinator::removeConsumer(std::uint64_t subscriptionId, const Address& consumer) {
    auto it = subscriptions_.find(subscriptionId);
    if (it == subscriptions_.end()) {
        throw InvalidSubscription(subscriptionId);
    }
    if (it->second.erase(consumer) == 0) {
        throw InvalidConsumer(subscriptionId, consumer);
    }
}

bool LocalVrfCoordinator::consumerIsAdded(std::uint64_t subscriptionId, const Address& consumer) const {
    auto it = subscriptions_.find(subscriptionId);
    return it != subscriptions_.end() && it->second.count(consumer) != 0;
}

RequestId LocalVrfCoordinator::requestRandomWords(const RandomWordsRequest& request,
                                                  RandomnessConsumer& consumer) {
    auto sub = subscriptions_.find(request.subscriptionId);
    if (sub == subscriptions_.end()) {
        throw InvalidSubscription(request.subscriptionId);
    }
    Address consumerAddress = consumer.consumerAddress();
    if (sub->second.count(consumerAddress) == 0) {
        throw InvalidConsumer(request.subscriptionId, consumerAddress);
    }
    if (request.keyHash.empty()) {
        throw InvalidRandomnessRequest("key hash must not be empty");
    }
    if (request.requestConfirmations > kMaxRequestConfirmations) {
        throw InvalidRandomnessRequest("InvalidRequestConfirmations: " +
                                       std::to_string(request.requestConfirmations));
    }
    if (request.callbackGasLimit > kMaxCallbackGasLimit) {
        throw InvalidRandomnessRequest("GasLimitTooBig: " + std::to_string(request.callbackGasLimit));
    }
    if (request.numWords == 0 || request.numWords > kMaxNumWords) {
        throw InvalidRandomnessRequest("NumWordsTooBig: " + std::to_string(request.numWords));
    }

    RequestId requestId = nextRequestId_++;
    pending_.emplace(requestId, PendingRequest{ &consumer, std::move(consumerAddress), request });
    return requestId;
}

std::vector<RequestId> LocalVrfCoordinator::pendingRequests() const {
    std::vector<RequestId> ids;
    ids.reserve(pending_.size());
    for (const auto& entry : pending_) {
        ids.push_back(entry.first);
    }
    return ids;
}

LocalVrfCoordinator::PendingRequest LocalVrfCoordinator::takePending(RequestId requestId) {
    auto it = pending_.find(requestId);
    if (it == pending_.end()) {
        throw UnknownRequest(requestId);
    }
    PendingRequest pending = std::move(it->second);
    pending_.erase(it);
    return pending;
}

FulfillmentReceipt LocalVrfCoordinator::fulfillRandomWords(RequestId requestId) {
    auto pendingIt = pending_.find(requestId);
    if (pendingIt == pending_.end()) {
        throw UnknownRequest(requestId);
    }
    const PendingRequest& peek = pendingIt->second;

    FulfillmentReceipt receipt;
    receipt.requestId = requestId;
    receipt.alpha = buildAlpha(deploymentId_,
                               chainId_,
                               peek.request.keyHash,
                               peek.consumerAddress,
                               peek.request.subscriptionId,
                               requestId);

    std::vector<unsigned char> proof(crypto_vrf_PROOFBYTES);
    if (crypto_vrf_prove(proof.data(),
                         secretKey_.data(),
                         reinterpret_cast<const unsigned char*>(receipt.alpha.data()),
                         receipt.alpha.size()) != 0) {
        throw std::runtime_error("VRF prove failed");
    }
    std::vector<unsigned char> output(crypto_vrf_OUTPUTBYTES);
    if (crypto_vrf_proof_to_hash(output.data(), proof.data()) != 0) {
        throw std::runtime_error("VRF hash extraction failed");
    }

    receipt.vrfProofHex = bytesToHex(proof.data(), proof.size());
    receipt.vrfOutputHex = bytesToHex(output.data(), output.size());
    receipt.randomWords = deriveRandomWords(receipt.vrfOutputHex, requestId, peek.request.numWords);

    return deliver(takePending(requestId), std::move(receipt));
}

FulfillmentReceipt LocalVrfCoordinator::fulfillRandomWordsWithOverride(RequestId requestId,
                                                                       std::vector<RandomWord> randomWords) {
    auto pendingIt = pending_.find(requestId);
    if (pendingIt == pending_.end()) {
        throw UnknownRequest(requestId);
    }
    const std::uint32_t expected = pendingIt->second.request.numWords;
    if (randomWords.size() != expected) {
        throw InvalidRandomnessRequest("InvalidRandomWords: expected " + std::to_string(expected) + " words, got " +
                                       std::to_string(randomWords.size()));
    }

    FulfillmentReceipt receipt;
    receipt.requestId = requestId;
    receipt.randomWords = std::move(randomWords);
    return deliver(takePending(requestId), std::move(receipt));
}

FulfillmentReceipt LocalVrfCoordinator::deliver(const PendingRequest& pending, FulfillmentReceipt receipt) {
    receipt.consumer = pending.consumerAddress;
    try {
        pending.consumer->rawFulfillRandomWords(*this, receipt.requestId, receipt.randomWords);
        receipt.success = true;
    } catch (const std::exception& ex) {
        receipt.success = false;
        receipt.failureReason = ex.what();
    }
    return receipt;
}

std::string LocalVrfCoordinator::buildAlpha(const std::string& deploymentId,
                                            const std::string& chainId,
                                            const std::string& keyHash,
                                            const Address& consumer,
                                            std::uint64_t subscriptionId,
                                            RequestId requestId) {
    std::ostringstream oss;
    oss << kVrfDomainTag << "|" << buildDeploymentScope(deploymentId, chainId) << "|" << keyHash << "|"
        << consumer << "|" << subscriptionId << "|" << requestId;
    return oss.str();
}

bool LocalVrfCoordinator::verifyProof(const std::string& vrfProofHex,
                                      const std::string& vrfOutputHex,
                                      const std::string& publicKeyHex,
                                      const std::string& alpha) {
    if (!ensureSodiumReady()) {
        return false;
    }

    try {
        auto proof = hexToBytes(vrfProofHex);
        auto publicKey = hexToBytes(publicKeyHex);
        auto output = hexToBytes(vrfOutputHex);
        if (proof.size() != crypto_vrf_PROOFBYTES ||
            output.size() != crypto_vrf_OUTPUTBYTES ||
            publicKey.size() != crypto_vrf_PUBLICKEYBYTES) {
            return false;
        }

        std::vector<unsigned char> recomputed(crypto_vrf_OUTPUTBYTES);
        if (crypto_vrf_verify(recomputed.data(),
                              publicKey.data(),
                              proof.data(),
                              reinterpret_cast<const unsigned char*>(alpha.data()),
                              alpha.size()) != 0) {
            return false;
        }

        return std::equal(recomputed.begin(), recomputed.end(), output.begin());
    } catch (const std::invalid_argument&) {
        return false;
    }
}

std::vector<RandomWord> LocalVrfCoordinator::deriveRandomWords(const std::string& vrfOutputHex,
                                                               RequestId requestId,
                                                               std::uint32_t numWords) {
    std::vector<RandomWord> words;
    words.reserve(numWords);
    for (std::uint32_t i = 0; i < numWords; ++i) {
        std::ostringstream oss;
        oss << vrfOutputHex << ':' << requestId << ':' << i;
        std::string input = oss.str();

        std::array<std::uint8_t, 32> hash{};
        picosha2::hash256(input.begin(), input.end(), hash.begin(), hash.end());

        RandomWord word;
        boost::multiprecision::import_bits(word, hash.begin(), hash.end());
        words.push_back(word);
    }
    return words;
}

} // namespace raffle
