#include "randomness_coordinator.hpp"

#include "raffle_config.hpp"

#include <sstream>
#include <stdexcept>

namespace raffle {

void validateRequest(const RandomWordsRequest& request) {
    if (request.keyHash.empty()) {
        throw std::invalid_argument("Request key hash must not be empty");
    }
    if (request.requestConfirmations < kMinRequestConfirmations ||
        request.requestConfirmations > kMaxRequestConfirmations) {
        std::ostringstream oss;
        oss << "Invalid request confirmations " << request.requestConfirmations;
        throw std::invalid_argument(oss.str());
    }
    if (request.numWords == 0 || request.numWords > kMaxNumWords) {
        std::ostringstream oss;
        oss << "Invalid word count " << request.numWords;
        throw std::invalid_argument(oss.str());
    }
    if (request.callbackGasLimit == 0 || request.callbackGasLimit > kMaxCallbackGasLimit) {
        std::ostringstream oss;
        oss << "Callback gas limit " << request.callbackGasLimit << " outside coordinator bounds";
        throw std::invalid_argument(oss.str());
    }
}

QueuedCoordinator::QueuedCoordinator(Address address)
    : address_(std::move(address)) {
    if (address_.empty()) {
        throw std::invalid_argument("Coordinator address must not be empty");
    }
}

RequestId QueuedCoordinator::requestRandomWords(const RandomWordsRequest& request,
                                                RandomnessConsumer& consumer) {
    validateRequest(request);
    RequestId id = nextId_++;
    pending_.emplace(id, PendingRequest{ id, request, &consumer });
    return id;
}

std::vector<RequestId> QueuedCoordinator::pendingIds() const {
    std::vector<RequestId> ids;
    ids.reserve(pending_.size());
    for (const auto& entry : pending_) {
        ids.push_back(entry.first);
    }
    return ids;
}

const QueuedCoordinator::PendingRequest& QueuedCoordinator::peekPending(
    RequestId requestId) const {
    auto it = pending_.find(requestId);
    if (it == pending_.end()) {
        throw std::invalid_argument("No pending request with id " + std::to_string(requestId));
    }
    return it->second;
}

QueuedCoordinator::PendingRequest QueuedCoordinator::takePending(RequestId requestId) {
    PendingRequest pending = peekPending(requestId);
    pending_.erase(requestId);
    return pending;
}

void QueuedCoordinator::deliver(const PendingRequest& pending,
                                const std::vector<RandomWord>& words) const {
    pending.consumer->rawFulfillRandomWords(address_, pending.id, words);
}

RandomWord wordFromDigest(const std::vector<unsigned char>& digest) {
    RandomWord word;
    boost::multiprecision::import_bits(word, digest.begin(), digest.end());
    return word;
}

} // namespace raffle
