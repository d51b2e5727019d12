#include "entry_ledger.hpp"

#include "raffle_errors.hpp"

#include <limits>
#include <stdexcept>

namespace raffle {

EntryLedger::EntryLedger(Amount entranceFee)
    : entranceFee_(entranceFee) {
    if (entranceFee_ == 0) {
        throw std::invalid_argument("Entrance fee must be positive");
    }
}

void EntryLedger::record(const Address& participant, Amount amount) {
    if (amount < entranceFee_) {
        throw InsufficientFeeError(amount, entranceFee_);
    }
    if (participant.empty()) {
        throw std::invalid_argument("Participant address must not be empty");
    }
    if (amount > std::numeric_limits<Amount>::max() - balance_) {
        throw std::overflow_error("Pot capacity exceeded");
    }
    participants_.push_back(participant);
    balance_ += amount;
}

const Address& EntryLedger::participantAt(std::size_t index) const {
    if (index >= participants_.size()) {
        throw std::out_of_range("No participant at index " + std::to_string(index));
    }
    return participants_[index];
}

void EntryLedger::credit(Amount amount) {
    if (amount > std::numeric_limits<Amount>::max() - balance_) {
        throw std::overflow_error("Pot capacity exceeded");
    }
    balance_ += amount;
}

void EntryLedger::debit(Amount amount) {
    if (amount > balance_) {
        throw std::logic_error("Debit exceeds raffle balance");
    }
    balance_ -= amount;
}

} // namespace raffle
