#include "vrf_coordinator.hpp"

#include "picosha2.h"

#include <algorithm>
#include <sstream>
#include <stdexcept>
#include <string_view>

#include <sodium.h>

namespace raffle {

#ifndef crypto_vrf_PROOFBYTES
#error "libsodium must provide crypto_vrf_* support (version >= 1.0.18)"
#endif

namespace {

constexpr std::string_view kVrfDomainTag = "fair-raffle:vrf:v1";

std::string buildDeploymentScope(const std::string& deploymentId, const std::string& chainId) {
    if (deploymentId.empty()) {
        throw std::invalid_argument("deploymentId must not be empty for VRF domain separation");
    }
    if (chainId.empty()) {
        return deploymentId;
    }
    return deploymentId + "|" + chainId;
}

VrfKeyPair encodeKeypair(std::vector<unsigned char>& publicKey,
                         std::vector<unsigned char>& secretKey) {
    VrfKeyPair pair{
        bytesToHex(publicKey.data(), publicKey.size()),
        bytesToHex(secretKey.data(), secretKey.size()),
    };
    secureZero(secretKey.data(), secretKey.size());
    return pair;
}

} // namespace

VrfCoordinator::VrfCoordinator(Address address,
                               std::string secretKeyHex,
                               std::string publicKeyHex,
                               std::string deploymentId,
                               std::string chainId)
    : QueuedCoordinator(std::move(address))
    , deploymentId_(std::move(deploymentId))
    , chainId_(std::move(chainId))
    , publicKeyHex_(std::move(publicKeyHex)) {
    requireSodium();
    (void)buildDeploymentScope(deploymentId_, chainId_);

    auto secretBytes = hexToBytes(secretKeyHex);
    secureZero(&secretKeyHex[0], secretKeyHex.size());
    if (secretBytes.size() != crypto_vrf_SECRETKEYBYTES) {
        secureZero(secretBytes.data(), secretBytes.size());
        throw std::invalid_argument("VRF secret key length invalid");
    }
    secretKey_ = SecretBytes(std::move(secretBytes));

    auto publicKey = hexToBytes(publicKeyHex_);
    if (publicKey.size() != crypto_vrf_PUBLICKEYBYTES) {
        throw std::invalid_argument("VRF public key length invalid");
    }
    std::vector<unsigned char> derived(crypto_vrf_PUBLICKEYBYTES);
    crypto_vrf_sk_to_pk(derived.data(), secretKey_.data());
    if (!std::equal(derived.begin(), derived.end(), publicKey.begin())) {
        throw std::invalid_argument("VRF public key does not match the secret key");
    }
}

std::string VrfCoordinator::buildAlpha(const std::string& deploymentId,
                                       const std::string& chainId,
                                       RequestId requestId,
                                       const RandomWordsRequest& request) {
    std::ostringstream oss;
    oss << kVrfDomainTag << "|" << buildDeploymentScope(deploymentId, chainId) << "|"
        << request.keyHash << "|" << request.subscriptionId << "|" << requestId;
    return oss.str();
}

VrfFulfillment VrfCoordinator::fulfillRandomWords(RequestId requestId) {
    const PendingRequest& peeked = peekPending(requestId);

    VrfFulfillment record;
    record.requestId = requestId;
    record.alpha = buildAlpha(deploymentId_, chainId_, requestId, peeked.request);

    std::vector<unsigned char> proof(crypto_vrf_PROOFBYTES);
    if (crypto_vrf_prove(proof.data(),
                         secretKey_.data(),
                         reinterpret_cast<const unsigned char*>(record.alpha.data()),
                         record.alpha.size()) != 0) {
        throw std::runtime_error("VRF prove failed");
    }
    std::vector<unsigned char> output(crypto_vrf_OUTPUTBYTES);
    if (crypto_vrf_proof_to_hash(output.data(), proof.data()) != 0) {
        throw std::runtime_error("VRF hash extraction failed");
    }

    record.proofHex = bytesToHex(proof.data(), proof.size());
    record.outputHex = bytesToHex(output.data(), output.size());
    if (!verify(record.proofHex, record.outputHex, publicKeyHex_, record.alpha)) {
        throw std::runtime_error("VRF proof does not verify with the coordinator public key");
    }
    record.words = deriveWords(record.outputHex, peeked.request.numWords);

    PendingRequest pending = takePending(requestId);
    fulfillments_.push_back(record);
    deliver(pending, record.words);
    return record;
}

bool VrfCoordinator::verify(const std::string& proofHex,
                            const std::string& outputHex,
                            const std::string& publicKeyHex,
                            const std::string& alpha) {
    try {
        requireSodium();
        auto proof = hexToBytes(proofHex);
        auto publicKey = hexToBytes(publicKeyHex);
        auto output = hexToBytes(outputHex);
        if (proof.size() != crypto_vrf_PROOFBYTES ||
            output.size() != crypto_vrf_OUTPUTBYTES ||
            publicKey.size() != crypto_vrf_PUBLICKEYBYTES) {
            return false;
        }

        std::vector<unsigned char> recomputed(crypto_vrf_OUTPUTBYTES);
        if (crypto_vrf_verify(recomputed.data(),
                              publicKey.data(),
                              proof.data(),
                              reinterpret_cast<const unsigned char*>(alpha.data()),
                              alpha.size()) != 0) {
            return false;
        }

        return std::equal(recomputed.begin(), recomputed.end(), output.begin());
    } catch (const std::exception&) {
        return false;
    }
}

std::vector<RandomWord> VrfCoordinator::deriveWords(const std::string& outputHex,
                                                    std::uint32_t numWords) {
    std::vector<RandomWord> words;
    words.reserve(numWords);
    for (std::uint32_t i = 0; i < numWords; ++i) {
        std::string input = outputHex + ":" + std::to_string(i);
        std::vector<unsigned char> digest(picosha2::k_digest_size);
        picosha2::hash256(input.begin(), input.end(), digest.begin(), digest.end());
        words.push_back(wordFromDigest(digest));
    }
    return words;
}

VrfKeyPair generateVrfKeypair() {
    requireSodium();
    std::vector<unsigned char> publicKey(crypto_vrf_PUBLICKEYBYTES);
    std::vector<unsigned char> secretKey(crypto_vrf_SECRETKEYBYTES);
    crypto_vrf_keypair(publicKey.data(), secretKey.data());
    return encodeKeypair(publicKey, secretKey);
}

VrfKeyPair deriveVrfKeypairFromSeed(const std::string& seedHex) {
    requireSodium();
    auto seed = hexToBytes(seedHex);
    if (seed.size() != crypto_vrf_SEEDBYTES) {
        throw std::invalid_argument("Seed must decode to crypto_vrf_SEEDBYTES bytes");
    }

    std::vector<unsigned char> publicKey(crypto_vrf_PUBLICKEYBYTES);
    std::vector<unsigned char> secretKey(crypto_vrf_SECRETKEYBYTES);
    if (crypto_vrf_keypair_from_seed(publicKey.data(), secretKey.data(), seed.data()) != 0) {
        secureZero(seed.data(), seed.size());
        throw std::runtime_error("Failed to derive VRF keypair from seed");
    }
    secureZero(seed.data(), seed.size());
    return encodeKeypair(publicKey, secretKey);
}

} // namespace raffle
