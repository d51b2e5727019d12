#pragma once

#include "randomness_coordinator.hpp"

#include <vector>

namespace raffle {

// Deterministic coordinator for local runs and tests. Words for request id r are
// SHA-256("r:i") read as big-endian integers.
class MockCoordinator : public QueuedCoordinator {
public:
    explicit MockCoordinator(Address address = "mock-coordinator");

    std::vector<RandomWord> fulfillRandomWords(RequestId requestId);
    void fulfillRandomWordsWithOverride(RequestId requestId, const std::vector<RandomWord>& words);

    // Makes the next requestRandomWords call throw std::runtime_error.
    void failNextRequest() { failNextRequest_ = true; }

    RequestId requestRandomWords(const RandomWordsRequest& request,
                                 RandomnessConsumer& consumer) override;

    std::size_t getRequestCount() const { return requestCount_; }
    const RandomWordsRequest& getLastRequest() const { return lastRequest_; }

    static std::vector<RandomWord> deriveWords(RequestId requestId, std::uint32_t numWords);

private:
    bool failNextRequest_ = false;
    std::size_t requestCount_ = 0;
    RandomWordsRequest lastRequest_;
};

} // namespace raffle
