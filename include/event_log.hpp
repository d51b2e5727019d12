#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace raffle {

// Append-only log of raffle notifications. Each event is stored as the SHA-256
// of its canonical text; the Merkle root commits to the whole history.
class EventLog {
public:
    void append(const std::string& event);

    std::string getLeaf(std::size_t index) const;
    const std::vector<std::string>& getLeaves() const { return leaves_; }
    const std::vector<std::string>& getEvents() const { return events_; }

    std::string merkleRoot() const;
    std::vector<std::string> merkleProof(std::size_t leafIndex) const;
    static bool verifyProof(const std::string& leafHash,
                            std::size_t leafIndex,
                            const std::vector<std::string>& proof,
                            const std::string& root);

    static std::string hash(const std::string& data);

    std::size_t size() const { return leaves_.size(); }
    void clear();

private:
    static std::string hashPair(const std::string& left, const std::string& right);

    std::vector<std::string> events_;
    std::vector<std::string> leaves_;
};

} // namespace raffle
