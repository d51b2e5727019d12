#include "raffle.hpp"

#include "raffle_errors.hpp"

#include <sstream>
#include <stdexcept>
#include <utility>

namespace raffle {

namespace {

// Addresses are caller-supplied; keep the event text unambiguous.
std::string escapeField(const std::string& input) {
    std::ostringstream oss;
    oss << std::uppercase << std::hex;
    for (unsigned char c : input) {
        if (c == ':' || c == '%') {
            oss << '%' << static_cast<int>(c);
        } else {
            oss << static_cast<char>(c);
        }
    }
    return oss.str();
}

template <typename... Handlers>
struct Overloaded : Handlers... {
    using Handlers::operator()...;
};
template <typename... Handlers>
Overloaded(Handlers...) -> Overloaded<Handlers...>;

} // namespace

std::string describeEvent(const RaffleEvent& event) {
    return std::visit(
        Overloaded{
            [](const RaffleEntered& e) {
                return "raffle-entered:" + escapeField(e.participant) + ":" +
                       std::to_string(e.amount);
            },
            [](const RequestedRaffleWinner& e) {
                return "requested-raffle-winner:" + std::to_string(e.requestId);
            },
            [](const WinnerPicked& e) {
                return "winner-picked:" + escapeField(e.winner) + ":" + std::to_string(e.amount);
            },
        },
        event);
}

Raffle::Raffle(const RaffleConfig& cfg,
               CoordinatorPtr coordinator,
               PayoutSinkPtr payouts,
               ClockPtr clock)
    : config_(cfg)
    , coordinator_(std::move(coordinator))
    , payouts_(std::move(payouts))
    , clock_(std::move(clock))
    , log_(createLogger("raffle"))
    , state_(OpenRound{})
    , ledger_(cfg.entranceFee)
    , roundClock_(clock_ ? clock_->now() : 0, cfg.intervalSeconds) {
    validateConfig(config_);
    if (!coordinator_) {
        throw std::invalid_argument("Raffle requires a randomness coordinator");
    }
    if (!payouts_) {
        throw std::invalid_argument("Raffle requires a payout sink");
    }
    if (!clock_) {
        throw std::invalid_argument("Raffle requires a clock");
    }
    log_->info("raffle opened: fee={} interval={}s coordinator={}",
               config_.entranceFee,
               config_.intervalSeconds,
               coordinator_->getAddress());
}

RaffleState Raffle::getRaffleState() const {
    return std::holds_alternative<OpenRound>(state_) ? RaffleState::OPEN
                                                     : RaffleState::CALCULATING;
}

std::optional<RequestId> Raffle::getPendingRequestId() const {
    if (const auto* calculating = std::get_if<CalculatingRound>(&state_)) {
        return calculating->requestId;
    }
    return std::nullopt;
}

void Raffle::enter(const Address& caller, Amount amount) {
    if (!std::holds_alternative<OpenRound>(state_)) {
        log_->warn("entry from {} rejected: raffle is calculating", caller);
        throw NotOpenError();
    }
    try {
        ledger_.record(caller, amount);
    } catch (const InsufficientFeeError& ex) {
        log_->warn("entry from {} rejected: {}", caller, ex.what());
        throw;
    }
    log_->debug("{} entered with {} (players={})", caller, amount, ledger_.participantCount());
    emit(RaffleEntered{ caller, amount });
}

UpkeepCheck Raffle::checkUpkeep(const std::string& checkData) const {
    (void)checkData;
    UpkeepInputs inputs;
    inputs.intervalElapsed = roundClock_.intervalElapsed(clock_->now());
    inputs.state = getRaffleState();
    inputs.balance = ledger_.getBalance();
    inputs.participants = ledger_.participantCount();
    return evaluateUpkeep(inputs);
}

RandomWordsRequest Raffle::buildRequest() const {
    RandomWordsRequest request;
    request.keyHash = config_.keyHash;
    request.subscriptionId = config_.subscriptionId;
    request.requestConfirmations = config_.requestConfirmations;
    request.callbackGasLimit = config_.callbackGasLimit;
    request.numWords = config_.numWords;
    request.nativePayment = config_.nativePayment;
    return request;
}

RequestId Raffle::performUpkeep(const std::string& performData) {
    (void)performData;
    UpkeepCheck check = checkUpkeep();
    if (!check.needed) {
        log_->warn("upkeep rejected: time={} open={} balance={} players={}",
                   check.timePassed,
                   check.isOpen,
                   check.hasBalance,
                   check.hasPlayers);
        throw UpkeepNotNeededError(ledger_.getBalance(), ledger_.participantCount(), getRaffleState());
    }

    // Lock the round before calling out so no second trigger can get through.
    state_ = CalculatingRound{ std::nullopt, clock_->now() };
    RequestId requestId = 0;
    try {
        requestId = coordinator_->requestRandomWords(buildRequest(), *this);
    } catch (const std::exception& ex) {
        state_ = OpenRound{};
        log_->error("randomness request failed, round reopened: {}", ex.what());
        throw;
    }
    std::get<CalculatingRound>(state_).requestId = requestId;

    log_->info("requested winner for {} players, request id {}",
               ledger_.participantCount(),
               requestId);
    emit(RequestedRaffleWinner{ requestId });
    return requestId;
}

std::size_t Raffle::selectWinnerIndex(const RandomWord& word, std::size_t participants) {
    if (participants == 0) {
        throw std::invalid_argument("Cannot select a winner without participants");
    }
    RandomWord index = word % RandomWord(participants);
    return index.convert_to<std::size_t>();
}

void Raffle::rawFulfillRandomWords(const Address& caller,
                                   RequestId requestId,
                                   const std::vector<RandomWord>& randomWords) {
    if (caller != coordinator_->getAddress()) {
        log_->warn("fulfillment for request {} from unexpected caller {}", requestId, caller);
        throw OnlyCoordinatorCanFulfillError(caller, coordinator_->getAddress());
    }
    const auto* calculating = std::get_if<CalculatingRound>(&state_);
    if (calculating == nullptr) {
        log_->warn("fulfillment for request {} while open", requestId);
        throw FulfillmentNotExpectedError(requestId);
    }
    if (!calculating->requestId || *calculating->requestId != requestId) {
        RequestId pending = calculating->requestId.value_or(0);
        log_->warn("fulfillment for request {} does not match pending {}", requestId, pending);
        throw UnknownRequestError(requestId, pending);
    }
    if (randomWords.empty()) {
        throw InvalidRandomWordsError("expected at least one word");
    }
    if (ledger_.participantCount() == 0) {
        throw std::logic_error("Calculating round has no participants");
    }

    std::size_t winnerIndex = selectWinnerIndex(randomWords.front(), ledger_.participantCount());
    Address winner = ledger_.participantAt(winnerIndex);
    Amount pot = ledger_.getBalance();

    recentWinner_ = winner;
    state_ = OpenRound{};
    ledger_.clearParticipants();
    roundClock_.reset(clock_->now());
    ledger_.debit(pot);
    log_->info("request {} picked {} (index {}) for a pot of {}", requestId, winner, winnerIndex, pot);
    emit(WinnerPicked{ winner, pot });

    payout(winner, pot);
}

void Raffle::payout(const Address& winner, Amount pot) {
    bool paid = false;
    try {
        paid = payouts_->transfer(winner, pot);
    } catch (const std::exception& ex) {
        log_->error("transfer of {} to {} threw: {}", pot, winner, ex.what());
    }
    if (paid) {
        log_->info("paid {} to {}", pot, winner);
        return;
    }
    // The round stays reset; keep the funds on the books for reconciliation.
    ledger_.credit(pot);
    log_->error("payout of {} to {} failed; {} held for reconciliation",
                pot,
                winner,
                ledger_.getBalance());
    throw PayoutTransferFailedError(winner, pot);
}

void Raffle::subscribe(RaffleEventCallback callback) {
    if (!callback) {
        throw std::invalid_argument("Raffle event callback must be callable");
    }
    subscribers_.push_back(std::move(callback));
}

void Raffle::emit(const RaffleEvent& event) {
    eventLog_.append(describeEvent(event));
    for (const auto& subscriber : subscribers_) {
        try {
            subscriber(event);
        } catch (const std::exception& ex) {
            log_->error("subscriber threw on event {}: {}", eventLog_.size() - 1, ex.what());
        }
    }
}

} // namespace raffle
