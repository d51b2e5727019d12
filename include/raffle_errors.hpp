#pragma once

#include "raffle_types.hpp"

#include <cstddef>
#include <stdexcept>
#include <string>

namespace raffle {

class RaffleError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class NotOpenError : public RaffleError {
public:
    NotOpenError();
};

class InsufficientFeeError : public RaffleError {
public:
    InsufficientFeeError(Amount sent, Amount required);

    Amount sent() const { return sent_; }
    Amount required() const { return required_; }

private:
    Amount sent_;
    Amount required_;
};

class UpkeepNotNeededError : public RaffleError {
public:
    UpkeepNotNeededError(Amount balance, std::size_t participants, RaffleState state);

    Amount balance() const { return balance_; }
    std::size_t participants() const { return participants_; }
    RaffleState state() const { return state_; }

private:
    Amount balance_;
    std::size_t participants_;
    RaffleState state_;
};

class OnlyCoordinatorCanFulfillError : public RaffleError {
public:
    OnlyCoordinatorCanFulfillError(Address have, Address want);

    const Address& have() const { return have_; }
    const Address& want() const { return want_; }

private:
    Address have_;
    Address want_;
};

class FulfillmentNotExpectedError : public RaffleError {
public:
    explicit FulfillmentNotExpectedError(RequestId received);

    RequestId received() const { return received_; }

private:
    RequestId received_;
};

class UnknownRequestError : public RaffleError {
public:
    UnknownRequestError(RequestId received, RequestId pending);

    RequestId received() const { return received_; }
    RequestId pending() const { return pending_; }

private:
    RequestId received_;
    RequestId pending_;
};

class InvalidRandomWordsError : public RaffleError {
public:
    explicit InvalidRandomWordsError(const std::string& reason);
};

// Raised after the round has already been reset; the unpaid amount stays in the
// raffle balance until it is reconciled externally.
class PayoutTransferFailedError : public RaffleError {
public:
    PayoutTransferFailedError(Address winner, Amount amount);

    const Address& winner() const { return winner_; }
    Amount amount() const { return amount_; }

private:
    Address winner_;
    Amount amount_;
};

} // namespace raffle
