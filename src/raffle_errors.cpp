#include "raffle_errors.hpp"

#include <sstream>
#include <utility>

namespace raffle {

namespace {

std::string describeFee(Amount sent, Amount required) {
    std::ostringstream oss;
    oss << "Insufficient entrance fee: sent " << sent << ", required " << required;
    return oss.str();
}

std::string describeUpkeep(Amount balance, std::size_t participants, RaffleState state) {
    std::ostringstream oss;
    oss << "Upkeep not needed: balance=" << balance << " participants=" << participants
        << " state=" << toString(state);
    return oss.str();
}

std::string describeRequest(RequestId received, RequestId pending) {
    std::ostringstream oss;
    oss << "Fulfillment for request " << received << " does not match pending request " << pending;
    return oss.str();
}

} // namespace

NotOpenError::NotOpenError()
    : RaffleError("Raffle is not open for entries") {}

InsufficientFeeError::InsufficientFeeError(Amount sent, Amount required)
    : RaffleError(describeFee(sent, required))
    , sent_(sent)
    , required_(required) {}

UpkeepNotNeededError::UpkeepNotNeededError(Amount balance,
                                           std::size_t participants,
                                           RaffleState state)
    : RaffleError(describeUpkeep(balance, participants, state))
    , balance_(balance)
    , participants_(participants)
    , state_(state) {}

OnlyCoordinatorCanFulfillError::OnlyCoordinatorCanFulfillError(Address have, Address want)
    : RaffleError("Only coordinator " + want + " can fulfill, called by " + have)
    , have_(std::move(have))
    , want_(std::move(want)) {}

FulfillmentNotExpectedError::FulfillmentNotExpectedError(RequestId received)
    : RaffleError("Fulfillment for request " + std::to_string(received) +
                  " received while no request is pending")
    , received_(received) {}

UnknownRequestError::UnknownRequestError(RequestId received, RequestId pending)
    : RaffleError(describeRequest(received, pending))
    , received_(received)
    , pending_(pending) {}

InvalidRandomWordsError::InvalidRandomWordsError(const std::string& reason)
    : RaffleError("Invalid random words: " + reason) {}

PayoutTransferFailedError::PayoutTransferFailedError(Address winner, Amount amount)
    : RaffleError("Payout of " + std::to_string(amount) + " to " + winner + " failed")
    , winner_(std::move(winner))
    , amount_(amount) {}

} // namespace raffle
