#include "raffle_config.hpp"
#include "raffle_errors.hpp"
#include "vrf_coordinator.hpp"

#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

using namespace raffle;

namespace {

[[noreturn]] void fail(const std::string& msg) {
    std::cerr << "vrf_coordinator_test failure: " << msg << std::endl;
    std::exit(1);
}

template <typename Error, typename Fn>
void expectThrows(const std::string& what, Fn&& fn) {
    try {
        fn();
    } catch (const Error&) {
        return;
    }
    fail(what + ": expected exception was not thrown");
}

class RecordingConsumer : public RandomnessConsumer {
public:
    explicit RecordingConsumer(Address address)
        : address_(std::move(address)) {}

    Address consumerAddress() const override { return address_; }

    void rawFulfillRandomWords(const RandomnessGateway&,
                               RequestId requestId,
                               const std::vector<RandomWord>& randomWords) override {
        if (refuse) {
            throw std::runtime_error("consumer refused");
        }
        lastRequestId = requestId;
        lastWords = randomWords;
        ++calls;
    }

    bool refuse = false;
    RequestId lastRequestId = 0;
    std::vector<RandomWord> lastWords;
    int calls = 0;

private:
    Address address_;
};

RandomWordsRequest makeRequest(std::uint64_t subscriptionId, std::uint32_t numWords) {
    RandomWordsRequest request;
    request.keyHash = kDefaultKeyHash;
    request.subscriptionId = subscriptionId;
    request.requestConfirmations = 3;
    request.callbackGasLimit = 500'000;
    request.numWords = numWords;
    return request;
}

} // namespace

int main() {
    const std::string seedHex = "000102030405060708090a0b0c0d0e0f000102030405060708090a0b0c0d0e0f";
    const VrfKeyPair keys = deriveVrfKeypairFromSeed(seedHex);
    if (deriveVrfKeypairFromSeed(seedHex).publicKeyHex != keys.publicKeyHex) {
        fail("seeded key derivation should be deterministic");
    }
    expectThrows<std::invalid_argument>("short seed", [] { deriveVrfKeypairFromSeed("0001"); });
    expectThrows<std::invalid_argument>("empty deployment id", [&] { LocalVrfCoordinator bad(keys, ""); });
    expectThrows<std::invalid_argument>("malformed secret key", [&] {
        LocalVrfCoordinator bad(VrfKeyPair{ keys.publicKeyHex, "zz" }, "vrf-tests");
    });

    LocalVrfCoordinator vrf(keys, "vrf-tests", "31337");
    RecordingConsumer consumer("0xconsumer");

    const std::uint64_t sub = vrf.createSubscription();
    if (sub != 1 || vrf.createSubscription() != 2) {
        fail("subscription ids should start at 1");
    }

    expectThrows<InvalidSubscription>("unknown subscription", [&] {
        vrf.requestRandomWords(makeRequest(42, 1), consumer);
    });
    expectThrows<InvalidConsumer>("unregistered consumer", [&] {
        vrf.requestRandomWords(makeRequest(sub, 1), consumer);
    });
    expectThrows<InvalidConsumer>("removing a consumer that was never added", [&] {
        vrf.removeConsumer(sub, "0xconsumer");
    });

    vrf.addConsumer(sub, consumer.consumerAddress());
    if (!vrf.consumerIsAdded(sub, "0xconsumer")) {
        fail("consumer should be registered");
    }

    expectThrows<InvalidRandomnessRequest>("too many confirmations", [&] {
        auto request = makeRequest(sub, 1);
        request.requestConfirmations = 201;
        vrf.requestRandomWords(request, consumer);
    });
    expectThrows<InvalidRandomnessRequest>("gas limit too big", [&] {
        auto request = makeRequest(sub, 1);
        request.callbackGasLimit = 2'500'001;
        vrf.requestRandomWords(request, consumer);
    });
    expectThrows<InvalidRandomnessRequest>("zero words", [&] { vrf.requestRandomWords(makeRequest(sub, 0), consumer); });
    expectThrows<InvalidRandomnessRequest>("too many words", [&] {
        vrf.requestRandomWords(makeRequest(sub, 501), consumer);
    });
    expectThrows<InvalidRandomnessRequest>("empty key hash", [&] {
        auto request = makeRequest(sub, 1);
        request.keyHash.clear();
        vrf.requestRandomWords(request, consumer);
    });

    RequestId first = vrf.requestRandomWords(makeRequest(sub, 3), consumer);
    RequestId second = vrf.requestRandomWords(makeRequest(sub, 1), consumer);
    if (first != 1 || second != 2 || vrf.pendingRequests().size() != 2) {
        fail("request ids should be sequential from 1 and stay pending");
    }

    try {
        vrf.fulfillRandomWords(99);
        fail("unknown request fulfilled");
    } catch (const UnknownRequest& err) {
        if (std::string(err.what()).find("nonexistent request") == std::string::npos) {
            fail("unexpected message: " + std::string(err.what()));
        }
    }

    FulfillmentReceipt receipt = vrf.fulfillRandomWords(first);
    if (!receipt.success || consumer.calls != 1 || consumer.lastRequestId != first) {
        fail("consumer should receive the words");
    }
    if (receipt.randomWords.size() != 3 || consumer.lastWords != receipt.randomWords) {
        fail("delivered words should match the receipt");
    }
    if (receipt.randomWords[0] == receipt.randomWords[1]) {
        fail("words of one request should differ");
    }
    if (receipt.alpha !=
        LocalVrfCoordinator::buildAlpha("vrf-tests", "31337", kDefaultKeyHash, "0xconsumer", sub, first)) {
        fail("alpha should bind deployment, key hash, consumer, subscription and request id");
    }
    if (!LocalVrfCoordinator::verifyProof(receipt.vrfProofHex, receipt.vrfOutputHex, vrf.getPublicKey(), receipt.alpha)) {
        fail("VRF proof should verify");
    }
    if (LocalVrfCoordinator::verifyProof(
            receipt.vrfProofHex, receipt.vrfOutputHex, vrf.getPublicKey(), receipt.alpha + "x")) {
        fail("VRF proof must not verify a different input");
    }
    if (LocalVrfCoordinator::deriveRandomWords(receipt.vrfOutputHex, first, 3) != receipt.randomWords) {
        fail("words should be reproducible from the VRF output");
    }
    expectThrows<UnknownRequest>("double fulfillment", [&] { vrf.fulfillRandomWords(first); });

    // Same key, same request: same words.
    {
        LocalVrfCoordinator replay(keys, "vrf-tests", "31337");
        RecordingConsumer other("0xconsumer");
        std::uint64_t replaySub = replay.createSubscription();
        replay.addConsumer(replaySub, other.consumerAddress());
        RequestId id = replay.requestRandomWords(makeRequest(replaySub, 3), other);
        FulfillmentReceipt again = replay.fulfillRandomWords(id);
        if (again.vrfOutputHex != receipt.vrfOutputHex || again.randomWords != receipt.randomWords) {
            fail("identical requests under the same key should reproduce the words");
        }
    }

    // Override: word count must match, and a failing consumer still consumes the request.
    expectThrows<InvalidRandomnessRequest>("override with the wrong word count", [&] {
        vrf.fulfillRandomWordsWithOverride(second, { RandomWord(1), RandomWord(2) });
    });
    if (!vrf.isPending(second)) {
        fail("rejected override must keep the request pending");
    }
    consumer.refuse = true;
    FulfillmentReceipt refused = vrf.fulfillRandomWordsWithOverride(second, { RandomWord(7) });
    if (refused.success || refused.failureReason != "consumer refused") {
        fail("consumer failure should be reported in the receipt");
    }
    if (vrf.isPending(second)) {
        fail("request should be consumed after a failed delivery");
    }

    vrf.removeConsumer(sub, "0xconsumer");
    expectThrows<InvalidConsumer>("removed consumer", [&] { vrf.requestRandomWords(makeRequest(sub, 1), consumer); });

    std::cout << "VRF coordinator tests passed. Public key: " << vrf.getPublicKey() << "\n";
    return 0;
}
