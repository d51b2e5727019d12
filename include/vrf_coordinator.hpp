#pragma once

#include "randomness_coordinator.hpp"
#include "sodium_util.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace raffle {

struct VrfKeyPair {
    std::string publicKeyHex;
    std::string secretKeyHex;
};

// Everything a third party needs to re-check one fulfillment.
struct VrfFulfillment {
    RequestId requestId = 0;
    std::string alpha;
    std::string proofHex;
    std::string outputHex;
    std::vector<RandomWord> words;
};

class VrfCoordinator : public QueuedCoordinator {
public:
    VrfCoordinator(Address address,
                   std::string secretKeyHex,
                   std::string publicKeyHex,
                   std::string deploymentId,
                   std::string chainId = {});

    // Proves the request's alpha, delivers the derived words to the consumer and
    // returns the audit record. Consumer exceptions propagate after the record is
    // stored.
    VrfFulfillment fulfillRandomWords(RequestId requestId);

    const std::vector<VrfFulfillment>& getFulfillments() const { return fulfillments_; }
    const std::string& getPublicKey() const { return publicKeyHex_; }
    const std::string& getDeploymentId() const { return deploymentId_; }
    const std::string& getChainId() const { return chainId_; }

    static std::string buildAlpha(const std::string& deploymentId,
                                  const std::string& chainId,
                                  RequestId requestId,
                                  const RandomWordsRequest& request);
    static bool verify(const std::string& proofHex,
                       const std::string& outputHex,
                       const std::string& publicKeyHex,
                       const std::string& alpha);
    static std::vector<RandomWord> deriveWords(const std::string& outputHex, std::uint32_t numWords);

private:
    std::string deploymentId_;
    std::string chainId_;
    std::string publicKeyHex_;
    SecretBytes secretKey_;
    std::vector<VrfFulfillment> fulfillments_;
};

VrfKeyPair generateVrfKeypair();
VrfKeyPair deriveVrfKeypairFromSeed(const std::string& seedHex);

} // namespace raffle
