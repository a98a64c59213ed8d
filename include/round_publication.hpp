#pragma once

#include <cstdint>
#include <string>

#include "raffle.hpp"
#include "raffle_config.hpp"

namespace raffle {

struct SigningKeyPair {
    std::string publicKeyHex;
    std::string secretKeyHex;
};

SigningKeyPair generateSigningKeypair();
SigningKeyPair deriveSigningKeypairFromSeed(const std::string& seedHex);

// A signed statement that `eventRoot` was the event log root when `round`
// closed on the named deployment.
struct RoundPublication {
    std::uint64_t round = 0;
    std::string eventRoot;
    std::string deploymentId;
    std::string chainId;
    std::string signatureHex;
    std::string publicKeyHex;
};

// "<deploymentId>:<chainId>:<round>:<eventRoot>"
std::string publicationMessage(const std::string& deploymentId,
                               const std::string& chainId,
                               std::uint64_t round,
                               const std::string& eventRoot);

// Throws std::invalid_argument for an invalid config, a root that is not 64 hex
// digits or a secret key of the wrong size.
RoundPublication signRoundPublication(const RaffleConfig& cfg,
                                      std::uint64_t round,
                                      const std::string& eventRoot,
                                      const std::string& secretKeyHex);

// Current round number and event root of a live raffle.
RoundPublication signRoundPublication(const Raffle& raffle, const std::string& secretKeyHex);

bool verifyRoundPublication(const RoundPublication& publication);

std::string toJson(const RoundPublication& publication);

} // namespace raffle
