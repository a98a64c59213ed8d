#include "draw_coordinator.hpp"
#include "encoding.hpp"
#include "vrf_coordinator.hpp"

#include <iostream>
#include <string>
#include <vector>

int main(int argc, char* argv[]) {
    if (argc < 10) {
        std::cerr << "Usage: audit_draw <vrfOutputHex> <vrfProofHex> <publicKeyHex> <keyHash> <consumer> "
                     "<subscriptionId> <requestId> <numPlayers> <deploymentId> [chainId]\n";
        return 1;
    }

    std::string vrfOutput = argv[1];
    std::string vrfProof = argv[2];
    std::string publicKey = argv[3];
    std::string keyHash = argv[4];
    std::string consumer = argv[5];
    std::string deploymentId = argv[9];
    std::string chainId = (argc > 10) ? argv[10] : "";

    std::uint64_t subscriptionId = 0;
    raffle::RequestId requestId = 0;
    std::size_t numPlayers = 0;
    try {
        subscriptionId = raffle::parseUnsignedDecimal("subscriptionId", argv[6]);
        requestId = raffle::parseUnsignedDecimal("requestId", argv[7]);
        numPlayers = static_cast<std::size_t>(raffle::parseUnsignedDecimal("numPlayers", argv[8]));
    } catch (const std::exception& ex) {
        std::cerr << ex.what() << '\n';
        return 1;
    }
    if (numPlayers == 0) {
        std::cerr << "numPlayers must be positive\n";
        return 1;
    }

    std::string alpha;
    try {
        alpha = raffle::LocalVrfCoordinator::buildAlpha(
            deploymentId, chainId, keyHash, consumer, subscriptionId, requestId);
    } catch (const std::exception& ex) {
        std::cerr << ex.what() << '\n';
        return 1;
    }

    bool ok = raffle::LocalVrfCoordinator::verifyProof(vrfProof, vrfOutput, publicKey, alpha);
    std::cout << "VRF input (alpha): " << alpha << '\n';
    std::cout << "VRF verification: " << (ok ? "valid" : "INVALID") << '\n';
    if (!ok) {
        return 2;
    }

    auto words = raffle::LocalVrfCoordinator::deriveRandomWords(vrfOutput, requestId, 1);
    std::size_t winnerIndex = raffle::DrawCoordinator::selectWinnerIndex(words.front(), numPlayers);
    std::cout << "Random word: " << words.front().str() << '\n';
    std::cout << "Winner index: " << winnerIndex << " of " << numPlayers << '\n';
    return 0;
}
