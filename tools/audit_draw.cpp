#include "raffle.hpp"
#include "raffle_config.hpp"
#include "vrf_coordinator.hpp"

#include <cstdint>
#include <exception>
#include <iostream>
#include <limits>
#include <stdexcept>
#include <string>

int main(int argc, char* argv[]) {
    if (argc < 9) {
        std::cerr << "Usage: audit_draw <vrfOutputHex> <vrfProofHex> <publicKeyHex> <keyHash> "
                     "<subscriptionId> <requestId> <participantCount> <deploymentId> [chainId]\n";
        return 1;
    }

    std::string output = argv[1];
    std::string proof = argv[2];
    std::string publicKey = argv[3];
    raffle::RandomWordsRequest request;
    request.keyHash = argv[4];
    std::string deploymentId = argv[8];
    std::string chainId = (argc > 9) ? argv[9] : "";

    constexpr std::uint64_t kAnyValue = std::numeric_limits<std::uint64_t>::max();
    std::uint64_t requestId = 0;
    std::uint64_t participants = 0;
    try {
        request.subscriptionId = raffle::parseUnsigned("subscriptionId", argv[5], kAnyValue);
        requestId = raffle::parseUnsigned("requestId", argv[6], kAnyValue);
        participants = raffle::parseUnsigned("participantCount", argv[7], kAnyValue);
    } catch (const std::invalid_argument& ex) {
        std::cerr << ex.what() << '\n';
        return 1;
    }
    if (participants == 0) {
        std::cerr << "participantCount must be positive\n";
        return 1;
    }

    std::string alpha;
    try {
        alpha = raffle::VrfCoordinator::buildAlpha(deploymentId, chainId, requestId, request);
    } catch (const std::exception& ex) {
        std::cerr << ex.what() << '\n';
        return 1;
    }

    bool ok = raffle::VrfCoordinator::verify(proof, output, publicKey, alpha);
    std::cout << "VRF input (alpha): " << alpha << '\n';
    std::cout << "VRF verification: " << (ok ? "valid" : "INVALID") << '\n';
    if (!ok) {
        return 2;
    }

    auto words = raffle::VrfCoordinator::deriveWords(output, raffle::kRaffleNumWords);
    std::size_t index = raffle::Raffle::selectWinnerIndex(words.front(), participants);
    std::cout << "Random word: " << words.front() << '\n';
    std::cout << "Winner index: " << index << " of " << participants << '\n';
    return 0;
}
