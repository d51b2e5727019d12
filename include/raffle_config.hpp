#pragma once

#include "raffle_types.hpp"

#include <cstdint>
#include <string>

namespace raffle {

// Bounds the coordinator enforces on every request.
constexpr std::uint16_t kMinRequestConfirmations = 3;
constexpr std::uint16_t kMaxRequestConfirmations = 200;
constexpr std::uint32_t kMaxNumWords = 500;
constexpr std::uint32_t kMaxCallbackGasLimit = 2'500'000;

// The raffle consumes exactly one word per round.
constexpr std::uint32_t kRaffleNumWords = 1;

struct RaffleConfig {
    Amount entranceFee = 10'000'000'000'000'000ULL; // 0.01 in 18-decimal base units
    std::uint64_t intervalSeconds = 30;
    std::string keyHash =
        "474e34a077df58807dbe9c96d3c009b23b3c6d0cce433e59bbf5b34f823bc56c";
    std::uint64_t subscriptionId = 0;
    std::uint32_t callbackGasLimit = 500'000;
    std::uint16_t requestConfirmations = 3;
    std::uint32_t numWords = kRaffleNumWords;
    bool nativePayment = false;
};

// Accepts decimal digits only. Throws std::invalid_argument naming the field
// when the text is empty, signed, malformed or above max.
std::uint64_t parseUnsigned(const char* name, const std::string& text, std::uint64_t max);

// Throws std::invalid_argument describing the first violated bound.
void validateConfig(const RaffleConfig& cfg);

// Applies RAFFLE_* environment overrides on top of base and validates the result.
RaffleConfig loadConfigFromEnvironment(RaffleConfig base = {});

struct DeploymentScope {
    std::string deploymentId;
    std::string chainId;
};

// Reads RAFFLE_DEPLOYMENT_ID (required, not "default") and RAFFLE_CHAIN_ID.
DeploymentScope requireDeploymentScope();

} // namespace raffle
