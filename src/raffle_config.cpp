#include "raffle_config.hpp"

#include "encoding.hpp"
#include "units.hpp"

#include <cstdlib>
#include <sstream>
#include <stdexcept>

namespace raffle {

namespace {

std::optional<std::string> readEnv(const char* name) {
    const char* raw = std::getenv(name);
    if (raw == nullptr) {
        return std::nullopt;
    }
    std::string value = trim(raw);
    if (value.empty()) {
        return std::nullopt;
    }
    return value;
}

bool isKeyHash(const std::string& value) {
    return value.size() == 66 && value.compare(0, 2, "0x") == 0 && isHexDigits(value.substr(2));
}

} // namespace

const std::vector<NetworkPreset>& networkPresets() {
    static const std::vector<NetworkPreset> presets{
        { 31337, "hardhat", "0.01", 30, kDefaultKeyHash, 500'000, true },
        { 11155111, "sepolia", "0.01", 30, kDefaultKeyHash, 500'000, false },
    };
    return presets;
}

std::optional<NetworkPreset> findNetworkPreset(std::uint64_t chainId) {
    for (const auto& preset : networkPresets()) {
        if (preset.chainId == chainId) {
            return preset;
        }
    }
    return std::nullopt;
}

bool isDevelopmentChain(const std::string& networkName) {
    return networkName == "hardhat" || networkName == "localhost";
}

RaffleConfig configForChain(std::uint64_t chainId) {
    auto preset = findNetworkPreset(chainId);
    if (!preset) {
        throw std::invalid_argument("no network preset for chain " + std::to_string(chainId));
    }
    RaffleConfig cfg;
    cfg.networkName = preset->name;
    cfg.chainId = preset->chainId;
    cfg.entranceFee = parseEther(preset->entranceFeeEther);
    cfg.interval = preset->interval;
    cfg.keyHash = preset->keyHash;
    cfg.callbackGasLimit = preset->callbackGasLimit;
    if (!preset->development) {
        // Live deployments must name themselves explicitly.
        cfg.deploymentId.clear();
    }
    return cfg;
}

RaffleConfig loadRaffleConfigFromEnv() {
    std::uint64_t chainId = 31337;
    if (auto value = readEnv("RAFFLE_CHAIN_ID")) {
        chainId = parseUnsignedDecimal("RAFFLE_CHAIN_ID", *value);
    }
    RaffleConfig cfg = configForChain(chainId);

    if (auto value = readEnv("RAFFLE_ENTRANCE_FEE")) {
        cfg.entranceFee = parseEther(*value);
    }
    if (auto value = readEnv("RAFFLE_INTERVAL")) {
        cfg.interval = parseUnsignedDecimal("RAFFLE_INTERVAL", *value);
    }
    if (auto value = readEnv("RAFFLE_KEY_HASH")) {
        cfg.keyHash = *value;
    }
    if (auto value = readEnv("RAFFLE_SUBSCRIPTION_ID")) {
        cfg.subscriptionId = parseUnsignedDecimal("RAFFLE_SUBSCRIPTION_ID", *value);
    }
    if (auto value = readEnv("RAFFLE_CALLBACK_GAS_LIMIT")) {
        cfg.callbackGasLimit = static_cast<std::uint32_t>(
            parseUnsignedDecimal("RAFFLE_CALLBACK_GAS_LIMIT", *value, kMaxCallbackGasLimit));
    }
    if (auto value = readEnv("RAFFLE_DEPLOYMENT_ID")) {
        cfg.deploymentId = *value;
    }

    validateRaffleConfig(cfg);
    return cfg;
}

void validateRaffleConfig(const RaffleConfig& cfg) {
    if (cfg.entranceFee == 0) {
        throw std::invalid_argument("entrance fee must be positive");
    }
    if (cfg.interval == 0) {
        throw std::invalid_argument("draw interval must be positive");
    }
    if (!isKeyHash(cfg.keyHash)) {
        throw std::invalid_argument("key hash must be 0x followed by 64 hex digits, got \"" + cfg.keyHash + "\"");
    }
    if (cfg.callbackGasLimit == 0 || cfg.callbackGasLimit > kMaxCallbackGasLimit) {
        std::ostringstream oss;
        oss << "callback gas limit must be within 1.." << kMaxCallbackGasLimit << ", got " << cfg.callbackGasLimit;
        throw std::invalid_argument(oss.str());
    }
    if (cfg.deploymentId.empty()) {
        throw std::invalid_argument(
            "deployment id is required (set RAFFLE_DEPLOYMENT_ID to an environment-specific value)");
    }
    if (cfg.deploymentId == "default") {
        throw std::invalid_argument(
            "deployment id cannot be \"default\"; set an environment-specific value such as \"mainnet\" or \"testnet\"");
    }
    if (!isDevelopmentChain(cfg.networkName) && cfg.subscriptionId == 0) {
        throw std::invalid_argument("network " + cfg.networkName +
                                    " needs a funded VRF subscription (set RAFFLE_SUBSCRIPTION_ID)");
    }
}

} // namespace raffle
