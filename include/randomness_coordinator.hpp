#pragma once

#include "raffle_types.hpp"

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace raffle {

struct RandomWordsRequest {
    std::string keyHash;
    std::uint64_t subscriptionId = 0;
    std::uint16_t requestConfirmations = 0;
    std::uint32_t callbackGasLimit = 0;
    std::uint32_t numWords = 0;
    bool nativePayment = false;
};

class RandomnessConsumer {
public:
    virtual ~RandomnessConsumer() = default;
    virtual void rawFulfillRandomWords(const Address& caller,
                                       RequestId requestId,
                                       const std::vector<RandomWord>& randomWords) = 0;
};

class RandomnessCoordinator {
public:
    virtual ~RandomnessCoordinator() = default;

    // Queues a request and returns its id. The consumer must outlive the request.
    virtual RequestId requestRandomWords(const RandomWordsRequest& request,
                                         RandomnessConsumer& consumer) = 0;
    virtual const Address& getAddress() const = 0;
};

using CoordinatorPtr = std::shared_ptr<RandomnessCoordinator>;

// Throws std::invalid_argument when the request is outside coordinator bounds.
void validateRequest(const RandomWordsRequest& request);

// Bookkeeping shared by the coordinators: ids start at 1 and each pending
// request is handed out at most once.
class QueuedCoordinator : public RandomnessCoordinator {
public:
    explicit QueuedCoordinator(Address address);

    RequestId requestRandomWords(const RandomWordsRequest& request,
                                 RandomnessConsumer& consumer) override;
    const Address& getAddress() const override { return address_; }

    bool isPending(RequestId requestId) const { return pending_.count(requestId) != 0; }
    std::size_t pendingCount() const { return pending_.size(); }
    std::vector<RequestId> pendingIds() const;

protected:
    struct PendingRequest {
        RequestId id = 0;
        RandomWordsRequest request;
        RandomnessConsumer* consumer = nullptr;
    };

    const PendingRequest& peekPending(RequestId requestId) const;
    // Removes the request so a second fulfillment of the same id fails.
    PendingRequest takePending(RequestId requestId);
    void deliver(const PendingRequest& pending, const std::vector<RandomWord>& words) const;

private:
    Address address_;
    RequestId nextId_ = 1;
    std::map<RequestId, PendingRequest> pending_;
};

RandomWord wordFromDigest(const std::vector<unsigned char>& digest);

} // namespace raffle
