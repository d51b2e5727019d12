#include "mock_coordinator.hpp"

#include "picosha2.h"

#include <stdexcept>
#include <string>

namespace raffle {

MockCoordinator::MockCoordinator(Address address)
    : QueuedCoordinator(std::move(address)) {}

RequestId MockCoordinator::requestRandomWords(const RandomWordsRequest& request,
                                              RandomnessConsumer& consumer) {
    if (failNextRequest_) {
        failNextRequest_ = false;
        throw std::runtime_error("Coordinator rejected the request");
    }
    RequestId id = QueuedCoordinator::requestRandomWords(request, consumer);
    ++requestCount_;
    lastRequest_ = request;
    return id;
}

std::vector<RandomWord> MockCoordinator::fulfillRandomWords(RequestId requestId) {
    PendingRequest pending = takePending(requestId);
    auto words = deriveWords(requestId, pending.request.numWords);
    deliver(pending, words);
    return words;
}

void MockCoordinator::fulfillRandomWordsWithOverride(RequestId requestId,
                                                     const std::vector<RandomWord>& words) {
    if (words.size() != peekPending(requestId).request.numWords) {
        throw std::invalid_argument("Override word count does not match the request");
    }
    deliver(takePending(requestId), words);
}

std::vector<RandomWord> MockCoordinator::deriveWords(RequestId requestId, std::uint32_t numWords) {
    std::vector<RandomWord> words;
    words.reserve(numWords);
    for (std::uint32_t i = 0; i < numWords; ++i) {
        std::string input = std::to_string(requestId) + ":" + std::to_string(i);
        std::vector<unsigned char> digest(picosha2::k_digest_size);
        picosha2::hash256(input.begin(), input.end(), digest.begin(), digest.end());
        words.push_back(wordFromDigest(digest));
    }
    return words;
}

} // namespace raffle
