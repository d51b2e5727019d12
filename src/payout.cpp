#include "payout.hpp"

#include <limits>
#include <stdexcept>

namespace raffle {

bool AccountBook::transfer(const Address& to, Amount amount) {
    if (to.empty() || rejecting_.count(to) != 0) {
        return false;
    }
    Amount& balance = balances_[to];
    if (amount > std::numeric_limits<Amount>::max() - balance) {
        return false;
    }
    balance += amount;

    auto hook = hooks_.find(to);
    if (hook != hooks_.end()) {
        // Copy so the hook may replace itself while running.
        ReceiveHook callback = hook->second;
        if (!callback(to, amount)) {
            balances_[to] -= amount;
            return false;
        }
    }
    ++transferCount_;
    return true;
}

void AccountBook::fund(const Address& account, Amount amount) {
    Amount& balance = balances_[account];
    if (amount > std::numeric_limits<Amount>::max() - balance) {
        throw std::overflow_error("Account balance overflow for " + account);
    }
    balance += amount;
}

void AccountBook::withdraw(const Address& account, Amount amount) {
    auto it = balances_.find(account);
    if (it == balances_.end() || it->second < amount) {
        throw std::runtime_error("Insufficient balance in account " + account);
    }
    it->second -= amount;
}

Amount AccountBook::balanceOf(const Address& account) const {
    auto it = balances_.find(account);
    return it == balances_.end() ? 0 : it->second;
}

void AccountBook::setReceiveHook(const Address& account, ReceiveHook hook) {
    if (hook) {
        hooks_[account] = std::move(hook);
    } else {
        hooks_.erase(account);
    }
}

} // namespace raffle
