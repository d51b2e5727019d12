#pragma once

#include "raffle_types.hpp"

#include <cstddef>
#include <vector>

namespace raffle {

// Participants of the current round in entry order, plus the value the raffle
// holds. The balance is kept separately from the list because an unpaid pot
// outlives the round that produced it.
class EntryLedger {
public:
    explicit EntryLedger(Amount entranceFee);

    // Checks the fee and records the entry; the open/closed gate is the caller's.
    void record(const Address& participant, Amount amount);

    const Address& participantAt(std::size_t index) const;
    std::size_t participantCount() const { return participants_.size(); }
    const std::vector<Address>& getParticipants() const { return participants_; }

    Amount getEntranceFee() const { return entranceFee_; }
    Amount getBalance() const { return balance_; }

    void clearParticipants() { participants_.clear(); }
    void credit(Amount amount);
    void debit(Amount amount);

private:
    Amount entranceFee_;
    Amount balance_ = 0;
    std::vector<Address> participants_;
};

} // namespace raffle
