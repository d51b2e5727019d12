#include "mock_coordinator.hpp"
#include "payout.hpp"
#include "raffle.hpp"
#include "raffle_errors.hpp"
#include "round_clock.hpp"

#include <cstdlib>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

[[noreturn]] void fail(const std::string& msg) {
    std::cerr << "entry_ledger_test failure: " << msg << std::endl;
    std::exit(1);
}

raffle::RaffleConfig smallConfig() {
    raffle::RaffleConfig cfg;
    cfg.entranceFee = 10;
    cfg.intervalSeconds = 30;
    return cfg;
}

} // namespace

int main() {
    using namespace raffle;

    auto coordinator = std::make_shared<MockCoordinator>();
    auto book = std::make_shared<AccountBook>();
    auto clock = std::make_shared<ManualClock>(1000);
    Raffle lottery(smallConfig(), coordinator, book, clock);

    std::vector<RaffleEvent> events;
    lottery.subscribe([&](const RaffleEvent& event) { events.push_back(event); });

    if (lottery.getRaffleState() != RaffleState::OPEN) {
        fail("raffle does not start open");
    }
    if (lottery.getLastTimeStamp() != 1000) {
        fail("round start is not the construction time");
    }
    if (lottery.getRecentWinner()) {
        fail("recent winner set before any draw");
    }

    // Entries are kept in call order, duplicates included.
    const std::vector<std::string> entrants{ "alice", "bob", "alice", "carol" };
    for (const auto& who : entrants) {
        lottery.enter(who, 10);
    }
    if (lottery.getNumberOfPlayers() != entrants.size()) {
        fail("participant count does not match successful entries");
    }
    for (std::size_t i = 0; i < entrants.size(); ++i) {
        if (lottery.getPlayer(i) != entrants[i]) {
            fail("participant order differs from entry order");
        }
    }
    if (lottery.getBalance() != 40) {
        fail("pot does not equal the sum of fees");
    }
    if (events.size() != entrants.size()) {
        fail("one entered event per entry expected");
    }
    const auto* entered = std::get_if<RaffleEntered>(&events.back());
    if (entered == nullptr || entered->participant != "carol" || entered->amount != 10) {
        fail("entered event does not carry the caller");
    }

    // Underpaying is rejected without touching the round.
    bool caught = false;
    try {
        lottery.enter("dave", 9);
    } catch (const InsufficientFeeError& ex) {
        caught = ex.sent() == 9 && ex.required() == 10;
    }
    if (!caught) {
        fail("insufficient fee not rejected with context");
    }
    if (lottery.getNumberOfPlayers() != entrants.size() || lottery.getBalance() != 40 ||
        events.size() != entrants.size()) {
        fail("rejected entry mutated the round");
    }

    // Overpayment stays in the pot.
    lottery.enter("erin", 25);
    if (lottery.getBalance() != 65 || lottery.getNumberOfPlayers() != 5) {
        fail("excess payment not retained");
    }

    bool outOfRange = false;
    try {
        (void)lottery.getPlayer(5);
    } catch (const std::out_of_range&) {
        outOfRange = true;
    }
    if (!outOfRange) {
        fail("reading past the last participant did not throw");
    }

    // Closed while calculating.
    clock->advance(31);
    lottery.performUpkeep();
    bool notOpen = false;
    try {
        lottery.enter("frank", 10);
    } catch (const NotOpenError&) {
        notOpen = true;
    }
    if (!notOpen) {
        fail("entry accepted while calculating");
    }
    if (lottery.getNumberOfPlayers() != 5 || lottery.getBalance() != 65) {
        fail("entry while calculating mutated the round");
    }

    bool emptyRejected = false;
    try {
        EntryLedger ledger(10);
        ledger.record("", 10);
    } catch (const std::invalid_argument&) {
        emptyRejected = true;
    }
    if (!emptyRejected) {
        fail("empty participant address accepted");
    }

    std::cout << "entry_ledger_test passed" << std::endl;
    return 0;
}
