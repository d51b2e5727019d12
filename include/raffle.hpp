#pragma once

#include "entry_ledger.hpp"
#include "event_log.hpp"
#include "logger.hpp"
#include "payout.hpp"
#include "raffle_config.hpp"
#include "raffle_types.hpp"
#include "randomness_coordinator.hpp"
#include "round_clock.hpp"
#include "upkeep.hpp"

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace raffle {

struct RaffleEntered {
    Address participant;
    Amount amount;
};

struct RequestedRaffleWinner {
    RequestId requestId;
};

struct WinnerPicked {
    Address winner;
    Amount amount;
};

using RaffleEvent = std::variant<RaffleEntered, RequestedRaffleWinner, WinnerPicked>;
using RaffleEventCallback = std::function<void(const RaffleEvent& event)>;

std::string describeEvent(const RaffleEvent& event);

class Raffle : public RandomnessConsumer {
public:
    Raffle(const RaffleConfig& cfg,
           CoordinatorPtr coordinator,
           PayoutSinkPtr payouts,
           ClockPtr clock);

    Raffle(const Raffle&) = delete;
    Raffle& operator=(const Raffle&) = delete;

    void enter(const Address& caller, Amount amount);

    UpkeepCheck checkUpkeep(const std::string& checkData = {}) const;
    RequestId performUpkeep(const std::string& performData = {});

    void rawFulfillRandomWords(const Address& caller,
                               RequestId requestId,
                               const std::vector<RandomWord>& randomWords) override;

    void subscribe(RaffleEventCallback callback);

    Amount getEntranceFee() const { return ledger_.getEntranceFee(); }
    std::uint64_t getInterval() const { return roundClock_.getInterval(); }
    RaffleState getRaffleState() const;
    const Address& getPlayer(std::size_t index) const { return ledger_.participantAt(index); }
    std::size_t getNumberOfPlayers() const { return ledger_.participantCount(); }
    Timestamp getLastTimeStamp() const { return roundClock_.getStartedAt(); }
    const std::optional<Address>& getRecentWinner() const { return recentWinner_; }
    Amount getBalance() const { return ledger_.getBalance(); }
    std::optional<RequestId> getPendingRequestId() const;
    const RaffleConfig& getConfig() const { return config_; }
    const EventLog& getEventLog() const { return eventLog_; }

    static std::size_t selectWinnerIndex(const RandomWord& word, std::size_t participants);

private:
    struct OpenRound {};
    struct CalculatingRound {
        // Empty while the coordinator call that assigns the id is in flight.
        std::optional<RequestId> requestId;
        Timestamp requestedAt = 0;
    };
    using RoundState = std::variant<OpenRound, CalculatingRound>;

    RandomWordsRequest buildRequest() const;
    void emit(const RaffleEvent& event);
    void payout(const Address& winner, Amount pot);

    RaffleConfig config_;
    CoordinatorPtr coordinator_;
    PayoutSinkPtr payouts_;
    ClockPtr clock_;
    Logger log_;

    RoundState state_;
    EntryLedger ledger_;
    RoundClock roundClock_;
    std::optional<Address> recentWinner_;
    EventLog eventLog_;
    std::vector<RaffleEventCallback> subscribers_;
};

} // namespace raffle
