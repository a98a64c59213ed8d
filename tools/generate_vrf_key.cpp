#include "round_publication.hpp"
#include "vrf_coordinator.hpp"

#include <iostream>
#include <stdexcept>

// Prints the coordinator's VRF key pair and the Ed25519 pair publish_round signs
// with. A seed makes both reproducible.
int main(int argc, char* argv[]) {
    try {
        raffle::VrfKeyPair vrfKeys =
            (argc > 1) ? raffle::deriveVrfKeypairFromSeed(argv[1]) : raffle::generateVrfKeypair();
        raffle::SigningKeyPair signingKeys =
            (argc > 1) ? raffle::deriveSigningKeypairFromSeed(argv[1]) : raffle::generateSigningKeypair();
        std::cout << "vrf_public_key=" << vrfKeys.publicKeyHex << '\n';
        std::cout << "vrf_secret_key=" << vrfKeys.secretKeyHex << '\n';
        std::cout << "signing_public_key=" << signingKeys.publicKeyHex << '\n';
        std::cout << "signing_secret_key=" << signingKeys.secretKeyHex << '\n';
    } catch (const std::exception& ex) {
        std::cerr << "Unable to produce key pairs: " << ex.what() << '\n';
        std::cerr << "Usage: generate_vrf_key [seedHex(32 bytes)]\n";
        return 1;
    }
    return 0;
}
