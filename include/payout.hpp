#pragma once

#include "raffle_types.hpp"

#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <set>

namespace raffle {

class PayoutSink {
public:
    virtual ~PayoutSink() = default;
    // Returns false when the recipient refuses or cannot take the funds.
    virtual bool transfer(const Address& to, Amount amount) = 0;
};

using PayoutSinkPtr = std::shared_ptr<PayoutSink>;

// Runs inside a transfer to the hooked address, after the amount is credited.
// Returning false refuses the transfer and reverses the credit.
using ReceiveHook = std::function<bool(const Address& to, Amount amount)>;

// In-memory native balances for simulations and tests.
class AccountBook : public PayoutSink {
public:
    bool transfer(const Address& to, Amount amount) override;

    void fund(const Address& account, Amount amount);
    // Throws std::runtime_error when the account cannot cover the amount.
    void withdraw(const Address& account, Amount amount);
    Amount balanceOf(const Address& account) const;

    void rejectTransfersTo(const Address& account) { rejecting_.insert(account); }
    void acceptTransfersTo(const Address& account) { rejecting_.erase(account); }
    void setReceiveHook(const Address& account, ReceiveHook hook);

    std::size_t getTransferCount() const { return transferCount_; }

private:
    std::map<Address, Amount> balances_;
    std::set<Address> rejecting_;
    std::map<Address, ReceiveHook> hooks_;
    std::size_t transferCount_ = 0;
};

} // namespace raffle
