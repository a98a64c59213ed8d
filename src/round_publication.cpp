#include "round_publication.hpp"

#include "encoding.hpp"

#include <cstdio>
#include <sstream>
#include <stdexcept>
#include <vector>

#include <sodium.h>

namespace raffle {

namespace {

constexpr std::size_t kRootHexLength = 64;

void requireSodium() {
    static bool ready = sodium_init() >= 0;
    if (!ready) {
        throw std::runtime_error("Unable to initialize libsodium");
    }
}

SigningKeyPair exportKeypair(const std::vector<unsigned char>& publicKey, std::vector<unsigned char>& secretKey) {
    SigningKeyPair pair{
        bytesToHex(publicKey.data(), publicKey.size()),
        bytesToHex(secretKey.data(), secretKey.size()),
    };
    sodium_memzero(secretKey.data(), secretKey.size());
    return pair;
}

std::string jsonString(const std::string& value) {
    std::string out = "\"";
    for (unsigned char c : value) {
        switch (c) {
        case '"':
            out += "\\\"";
            break;
        case '\\':
            out += "\\\\";
            break;
        case '\n':
            out += "\\n";
            break;
        case '\t':
            out += "\\t";
            break;
        default:
            if (c < 0x20) {
                char escaped[7];
                std::snprintf(escaped, sizeof(escaped), "\\u%04x", c);
                out += escaped;
            } else {
                out.push_back(static_cast<char>(c));
            }
        }
    }
    out.push_back('"');
    return out;
}

} // namespace

SigningKeyPair generateSigningKeypair() {
    requireSodium();
    std::vector<unsigned char> publicKey(crypto_sign_PUBLICKEYBYTES);
    std::vector<unsigned char> secretKey(crypto_sign_SECRETKEYBYTES);
    if (crypto_sign_keypair(publicKey.data(), secretKey.data()) != 0) {
        throw std::runtime_error("Ed25519 key generation failed");
    }
    return exportKeypair(publicKey, secretKey);
}

SigningKeyPair deriveSigningKeypairFromSeed(const std::string& seedHex) {
    requireSodium();
    auto seed = hexToBytes(seedHex);
    if (seed.size() != crypto_sign_SEEDBYTES) {
        sodium_memzero(seed.data(), seed.size());
        throw std::invalid_argument("Seed must decode to crypto_sign_SEEDBYTES bytes");
    }
    std::vector<unsigned char> publicKey(crypto_sign_PUBLICKEYBYTES);
    std::vector<unsigned char> secretKey(crypto_sign_SECRETKEYBYTES);
    int rc = crypto_sign_seed_keypair(publicKey.data(), secretKey.data(), seed.data());
    sodium_memzero(seed.data(), seed.size());
    if (rc != 0) {
        throw std::runtime_error("Failed to derive Ed25519 keypair from seed");
    }
    return exportKeypair(publicKey, secretKey);
}

std::string publicationMessage(const std::string& deploymentId,
                               const std::string& chainId,
                               std::uint64_t round,
                               const std::string& eventRoot) {
    std::ostringstream oss;
    oss << deploymentId << ':' << chainId << ':' << round << ':' << eventRoot;
    return oss.str();
}

RoundPublication signRoundPublication(const RaffleConfig& cfg,
                                      std::uint64_t round,
                                      const std::string& eventRoot,
                                      const std::string& secretKeyHex) {
    validateRaffleConfig(cfg);
    if (!isHexDigits(eventRoot, kRootHexLength)) {
        throw std::invalid_argument("event root must be 64 hex digits");
    }
    requireSodium();

    auto secretKey = hexToBytes(secretKeyHex);
    if (secretKey.size() != crypto_sign_SECRETKEYBYTES) {
        sodium_memzero(secretKey.data(), secretKey.size());
        throw std::invalid_argument("Ed25519 secret key must be " + std::to_string(crypto_sign_SECRETKEYBYTES) +
                                    " bytes (hex encoded)");
    }

    RoundPublication publication;
    publication.round = round;
    publication.eventRoot = eventRoot;
    publication.deploymentId = cfg.deploymentId;
    publication.chainId = std::to_string(cfg.chainId);

    std::vector<unsigned char> publicKey(crypto_sign_PUBLICKEYBYTES);
    if (crypto_sign_ed25519_sk_to_pk(publicKey.data(), secretKey.data()) != 0) {
        sodium_memzero(secretKey.data(), secretKey.size());
        throw std::runtime_error("Unable to derive public key from secret key");
    }

    const std::string message =
        publicationMessage(publication.deploymentId, publication.chainId, round, eventRoot);
    std::vector<unsigned char> signature(crypto_sign_BYTES);
    unsigned long long sigLen = 0;
    int rc = crypto_sign_detached(signature.data(),
                                  &sigLen,
                                  reinterpret_cast<const unsigned char*>(message.data()),
                                  message.size(),
                                  secretKey.data());
    sodium_memzero(secretKey.data(), secretKey.size());
    if (rc != 0) {
        throw std::runtime_error("Signing failed");
    }

    publication.signatureHex = bytesToHex(signature.data(), static_cast<std::size_t>(sigLen));
    publication.publicKeyHex = bytesToHex(publicKey.data(), publicKey.size());
    return publication;
}

RoundPublication signRoundPublication(const Raffle& raffle, const std::string& secretKeyHex) {
    return signRoundPublication(
        raffle.getConfig(), raffle.getRoundNumber(), raffle.getEvents().merkleRoot(), secretKeyHex);
}

bool verifyRoundPublication(const RoundPublication& publication) {
    if (sodium_init() < 0) {
        return false;
    }
    try {
        auto signature = hexToBytes(publication.signatureHex);
        auto publicKey = hexToBytes(publication.publicKeyHex);
        if (signature.size() != crypto_sign_BYTES || publicKey.size() != crypto_sign_PUBLICKEYBYTES) {
            return false;
        }
        const std::string message = publicationMessage(
            publication.deploymentId, publication.chainId, publication.round, publication.eventRoot);
        return crypto_sign_verify_detached(signature.data(),
                                           reinterpret_cast<const unsigned char*>(message.data()),
                                           message.size(),
                                           publicKey.data()) == 0;
    } catch (const std::invalid_argument&) {
        return false;
    }
}

std::string toJson(const RoundPublication& publication) {
    std::ostringstream json;
    json << "{\n";
    json << "  \"round\": " << publication.round << ",\n";
    json << "  \"event_root\": " << jsonString(publication.eventRoot) << ",\n";
    json << "  \"deployment_id\": " << jsonString(publication.deploymentId) << ",\n";
    json << "  \"chain_id\": " << jsonString(publication.chainId) << ",\n";
    json << "  \"signature\": " << jsonString(publication.signatureHex) << ",\n";
    json << "  \"public_key\": " << jsonString(publication.publicKeyHex) << "\n";
    json << "}\n";
    return json.str();
}

} // namespace raffle
