#include "raffle_config.hpp"

#include <cstdlib>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace raffle {

namespace {

std::string trim(const std::string& value) {
    const auto start = value.find_first_not_of(" \t\n\r\f\v");
    if (start == std::string::npos) {
        return "";
    }
    const auto end = value.find_last_not_of(" \t\n\r\f\v");
    return value.substr(start, end - start + 1);
}

bool readEnv(const char* name, std::string& out) {
    const char* env = std::getenv(name);
    if (env == nullptr) {
        return false;
    }
    out = trim(env);
    return !out.empty();
}

bool parseFlag(const char* name, const std::string& text) {
    if (text == "1" || text == "true" || text == "yes") {
        return true;
    }
    if (text == "0" || text == "false" || text == "no") {
        return false;
    }
    throw std::invalid_argument(std::string(name) + " must be a boolean, got \"" + text + "\"");
}

bool isHexString(const std::string& value) {
    return value.find_first_not_of("0123456789abcdefABCDEF") == std::string::npos;
}

} // namespace

std::uint64_t parseUnsigned(const char* name, const std::string& text, std::uint64_t max) {
    if (text.empty() || text.find_first_not_of("0123456789") != std::string::npos) {
        throw std::invalid_argument(std::string(name) + " must be an unsigned integer, got \"" +
                                    text + "\"");
    }
    std::uint64_t value = 0;
    try {
        value = std::stoull(text);
    } catch (const std::out_of_range&) {
        throw std::invalid_argument(std::string(name) + " is out of range");
    }
    if (value > max) {
        throw std::invalid_argument(std::string(name) + " exceeds " + std::to_string(max));
    }
    return value;
}

void validateConfig(const RaffleConfig& cfg) {
    if (cfg.entranceFee == 0) {
        throw std::invalid_argument("Entrance fee must be positive");
    }
    if (cfg.intervalSeconds == 0) {
        throw std::invalid_argument("Round interval must be positive");
    }
    if (cfg.keyHash.empty() || !isHexString(cfg.keyHash)) {
        throw std::invalid_argument("Key hash must be a non-empty hex string");
    }
    if (cfg.callbackGasLimit == 0 || cfg.callbackGasLimit > kMaxCallbackGasLimit) {
        std::ostringstream oss;
        oss << "Callback gas limit (" << cfg.callbackGasLimit << ") must be in [1, "
            << kMaxCallbackGasLimit << "]";
        throw std::invalid_argument(oss.str());
    }
    if (cfg.requestConfirmations < kMinRequestConfirmations ||
        cfg.requestConfirmations > kMaxRequestConfirmations) {
        std::ostringstream oss;
        oss << "Request confirmations (" << cfg.requestConfirmations << ") must be in ["
            << kMinRequestConfirmations << ", " << kMaxRequestConfirmations << "]";
        throw std::invalid_argument(oss.str());
    }
    if (cfg.numWords != kRaffleNumWords) {
        throw std::invalid_argument("The raffle requests exactly one random word");
    }
}

RaffleConfig loadConfigFromEnvironment(RaffleConfig base) {
    std::string value;
    if (readEnv("RAFFLE_ENTRANCE_FEE", value)) {
        base.entranceFee = parseUnsigned("RAFFLE_ENTRANCE_FEE", value,
                                         std::numeric_limits<Amount>::max());
    }
    if (readEnv("RAFFLE_INTERVAL_SECONDS", value)) {
        base.intervalSeconds = parseUnsigned("RAFFLE_INTERVAL_SECONDS", value,
                                             std::numeric_limits<std::uint64_t>::max());
    }
    if (readEnv("RAFFLE_KEY_HASH", value)) {
        if (value.rfind("0x", 0) == 0) {
            value = value.substr(2);
        }
        base.keyHash = value;
    }
    if (readEnv("RAFFLE_SUBSCRIPTION_ID", value)) {
        base.subscriptionId = parseUnsigned("RAFFLE_SUBSCRIPTION_ID", value,
                                            std::numeric_limits<std::uint64_t>::max());
    }
    if (readEnv("RAFFLE_CALLBACK_GAS_LIMIT", value)) {
        base.callbackGasLimit = static_cast<std::uint32_t>(
            parseUnsigned("RAFFLE_CALLBACK_GAS_LIMIT", value, kMaxCallbackGasLimit));
    }
    if (readEnv("RAFFLE_REQUEST_CONFIRMATIONS", value)) {
        base.requestConfirmations = static_cast<std::uint16_t>(
            parseUnsigned("RAFFLE_REQUEST_CONFIRMATIONS", value, kMaxRequestConfirmations));
    }
    if (readEnv("RAFFLE_NATIVE_PAYMENT", value)) {
        base.nativePayment = parseFlag("RAFFLE_NATIVE_PAYMENT", value);
    }
    validateConfig(base);
    return base;
}

DeploymentScope requireDeploymentScope() {
    DeploymentScope scope;
    if (!readEnv("RAFFLE_DEPLOYMENT_ID", scope.deploymentId)) {
        throw std::runtime_error(
            "RAFFLE_DEPLOYMENT_ID must be set to a non-empty deployment scope");
    }
    if (scope.deploymentId == "default") {
        throw std::runtime_error(
            "RAFFLE_DEPLOYMENT_ID cannot be \"default\"; set a deployment-specific value such as \"mainnet\" or \"testnet\"");
    }
    readEnv("RAFFLE_CHAIN_ID", scope.chainId);
    return scope;
}

} // namespace raffle
