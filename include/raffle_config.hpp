#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "raffle_types.hpp"

namespace raffle {

inline constexpr const char* kDefaultKeyHash =
    "0x474e34a077df58807dbe9c96d3c009b23b3c6d0cce433e59bbf5b34f823bc56c";
constexpr std::uint32_t kMaxCallbackGasLimit = 2'500'000;

struct NetworkPreset {
    std::uint64_t chainId;
    std::string name;
    std::string entranceFeeEther;
    std::uint64_t interval;
    std::string keyHash;
    std::uint32_t callbackGasLimit;
    bool development;
};

struct RaffleConfig {
    std::string networkName = "hardhat";
    std::uint64_t chainId = 31337;
    Wei entranceFee = Wei(10'000'000'000'000'000ULL); // 0.01 ether
    std::uint64_t interval = 30;
    std::string keyHash = kDefaultKeyHash;
    std::uint64_t subscriptionId = 0;
    std::uint32_t callbackGasLimit = 500'000;
    std::string deploymentId = "local-cli";
};

const std::vector<NetworkPreset>& networkPresets();
std::optional<NetworkPreset> findNetworkPreset(std::uint64_t chainId);
bool isDevelopmentChain(const std::string& networkName);

// Preset values for a known chain. Throws for chains without a preset.
RaffleConfig configForChain(std::uint64_t chainId);

// RAFFLE_CHAIN_ID picks the preset (default 31337); RAFFLE_ENTRANCE_FEE (ether),
// RAFFLE_INTERVAL (seconds), RAFFLE_KEY_HASH, RAFFLE_SUBSCRIPTION_ID,
// RAFFLE_CALLBACK_GAS_LIMIT and RAFFLE_DEPLOYMENT_ID override it. The result is
// validated before it is returned.
RaffleConfig loadRaffleConfigFromEnv();

void validateRaffleConfig(const RaffleConfig& cfg);

} // namespace raffle
