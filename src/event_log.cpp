#include "event_log.hpp"

#include "picosha2.h"

#include <vector>

namespace raffle {

std::string EventLog::hash(const std::string& data) {
    std::vector<unsigned char> digest(picosha2::k_digest_size);
    picosha2::hash256(data.begin(), data.end(), digest.begin(), digest.end());
    return picosha2::bytes_to_hex_string(digest.begin(), digest.end());
}

std::string EventLog::hashPair(const std::string& left, const std::string& right) {
    return hash(left + right);
}

void EventLog::append(const std::string& event) {
    events_.push_back(event);
    leaves_.push_back(hash(event));
}

std::string EventLog::getLeaf(std::size_t index) const {
    if (index >= leaves_.size()) {
        return {};
    }
    return leaves_[index];
}

std::string EventLog::merkleRoot() const {
    if (leaves_.empty()) {
        return {};
    }

    std::vector<std::string> layer = leaves_;
    while (layer.size() > 1) {
        std::vector<std::string> next;
        next.reserve((layer.size() + 1) / 2);
        for (std::size_t i = 0; i < layer.size(); i += 2) {
            const std::string& right = (i + 1 < layer.size()) ? layer[i + 1] : layer[i];
            next.push_back(hashPair(layer[i], right));
        }
        layer = std::move(next);
    }
    return layer.front();
}

std::vector<std::string> EventLog::merkleProof(std::size_t leafIndex) const {
    std::vector<std::string> proof;
    if (leafIndex >= leaves_.size()) {
        return proof;
    }

    std::vector<std::string> layer = leaves_;
    std::size_t index = leafIndex;
    while (layer.size() > 1) {
        std::size_t siblingIndex = (index % 2 == 0) ? index + 1 : index - 1;
        if (siblingIndex >= layer.size()) {
            siblingIndex = index; // odd tail pairs with itself
        }
        proof.push_back(layer[siblingIndex]);

        std::vector<std::string> next;
        next.reserve((layer.size() + 1) / 2);
        for (std::size_t i = 0; i < layer.size(); i += 2) {
            const std::string& right = (i + 1 < layer.size()) ? layer[i + 1] : layer[i];
            next.push_back(hashPair(layer[i], right));
        }
        layer = std::move(next);
        index /= 2;
    }
    return proof;
}

bool EventLog::verifyProof(const std::string& leafHash,
                           std::size_t leafIndex,
                           const std::vector<std::string>& proof,
                           const std::string& root) {
    if (leafHash.empty() || root.empty()) {
        return false;
    }
    std::string node = leafHash;
    std::size_t index = leafIndex;
    for (const auto& sibling : proof) {
        node = (index % 2 == 0) ? hashPair(node, sibling) : hashPair(sibling, node);
        index /= 2;
    }
    return index == 0 && node == root;
}

void EventLog::clear() {
    events_.clear();
    leaves_.clear();
}

} // namespace raffle
