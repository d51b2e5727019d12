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
    std::cerr << "raffle_lifecycle_test failure: " << msg << std::endl;
    std::exit(1);
}

struct Harness {
    std::shared_ptr<raffle::MockCoordinator> coordinator =
        std::make_shared<raffle::MockCoordinator>();
    std::shared_ptr<raffle::AccountBook> book = std::make_shared<raffle::AccountBook>();
    std::shared_ptr<raffle::ManualClock> clock = std::make_shared<raffle::ManualClock>(1000);
    std::unique_ptr<raffle::Raffle> lottery;

    Harness() {
        raffle::RaffleConfig cfg;
        cfg.entranceFee = 10;
        cfg.intervalSeconds = 30;
        cfg.subscriptionId = 42;
        lottery = std::make_unique<raffle::Raffle>(cfg, coordinator, book, clock);
    }

    raffle::RequestId openAndTrigger(const std::vector<std::string>& players) {
        for (const auto& player : players) {
            lottery->enter(player, 10);
        }
        clock->advance(31);
        return lottery->performUpkeep();
    }
};

template <typename Error, typename Fn>
bool throws(Fn&& fn) {
    try {
        fn();
    } catch (const Error&) {
        return true;
    }
    return false;
}

} // namespace

int main() {
    using namespace raffle;

    // Three entrants, word 7: index 7 mod 3 = 1, so bob takes the whole pot of 30.
    {
        Harness h;
        std::vector<RaffleEvent> events;
        h.lottery->subscribe([&](const RaffleEvent& event) { events.push_back(event); });

        RequestId id = h.openAndTrigger({ "alice", "bob", "carol" });
        if (h.lottery->getBalance() != 30) {
            fail("pot should hold 30 before the draw");
        }
        if (h.lottery->getRaffleState() != RaffleState::CALCULATING) {
            fail("state not calculating after trigger");
        }
        if (h.coordinator->getRequestCount() != 1 || h.coordinator->pendingCount() != 1) {
            fail("exactly one request should be outstanding");
        }
        if (!h.lottery->getPendingRequestId() || *h.lottery->getPendingRequestId() != id) {
            fail("pending request id not recorded");
        }
        const auto& request = h.coordinator->getLastRequest();
        if (request.numWords != 1 || request.subscriptionId != 42 ||
            request.requestConfirmations != 3 || request.keyHash != h.lottery->getConfig().keyHash) {
            fail("request does not carry the configured parameters");
        }
        const auto* issued = std::get_if<RequestedRaffleWinner>(&events.back());
        if (issued == nullptr || issued->requestId != id) {
            fail("request issued event missing the request id");
        }

        // A second trigger while calculating is refused and issues nothing.
        if (!throws<UpkeepNotNeededError>([&] { h.lottery->performUpkeep(); })) {
            fail("second trigger accepted while calculating");
        }
        if (h.coordinator->getRequestCount() != 1) {
            fail("second trigger issued another request");
        }

        h.clock->advance(5);
        h.coordinator->fulfillRandomWordsWithOverride(id, { RandomWord(7) });

        if (!h.lottery->getRecentWinner() || *h.lottery->getRecentWinner() != "bob") {
            fail("word 7 over three players should pick the second entrant");
        }
        if (h.book->balanceOf("bob") != 30) {
            fail("winner did not receive the whole pot");
        }
        if (h.lottery->getRaffleState() != RaffleState::OPEN) {
            fail("state not reset to open");
        }
        if (h.lottery->getNumberOfPlayers() != 0 || h.lottery->getBalance() != 0) {
            fail("round not cleared after payout");
        }
        if (h.lottery->getLastTimeStamp() != h.clock->now()) {
            fail("round timestamp not updated");
        }
        if (h.lottery->getPendingRequestId()) {
            fail("pending request survived fulfillment");
        }
        const auto* picked = std::get_if<WinnerPicked>(&events.back());
        if (picked == nullptr || picked->winner != "bob" || picked->amount != 30) {
            fail("winner picked event missing or wrong");
        }
        if (h.lottery->getEventLog().size() != events.size()) {
            fail("event log and subscribers disagree");
        }

        // The same callback cannot be delivered twice.
        if (!throws<std::invalid_argument>(
                [&] { h.coordinator->fulfillRandomWordsWithOverride(id, { RandomWord(1) }); })) {
            fail("coordinator redelivered a fulfilled request");
        }
        if (!throws<FulfillmentNotExpectedError>(
                [&] { h.lottery->rawFulfillRandomWords(h.coordinator->getAddress(), id, { RandomWord(1) }); })) {
            fail("duplicate callback accepted while open");
        }
        if (h.book->getTransferCount() != 1) {
            fail("duplicate callback paid out again");
        }
    }

    // Selection is word mod N over entry order, and depends only on its inputs.
    {
        RandomWord big("0xffffffffffffffffffffffffffffffffffffffffffffffffffffffffffffffff");
        if (Raffle::selectWinnerIndex(big, 7) != Raffle::selectWinnerIndex(big, 7)) {
            fail("selection not deterministic");
        }
        if (Raffle::selectWinnerIndex(big, 7) != (big % 7).convert_to<std::size_t>()) {
            fail("selection is not word mod N");
        }
        if (Raffle::selectWinnerIndex(RandomWord(7), 3) != 1 ||
            Raffle::selectWinnerIndex(RandomWord(3), 3) != 0) {
            fail("small word selection wrong");
        }
        if (!throws<std::invalid_argument>([&] { Raffle::selectWinnerIndex(big, 0); })) {
            fail("selection over zero participants did not throw");
        }
    }

    // Derived words from the mock pick the same winner as the formula.
    {
        Harness h;
        const std::vector<std::string> players{ "p0", "p1", "p2", "p3", "p4" };
        RequestId id = h.openAndTrigger(players);
        auto expected = MockCoordinator::deriveWords(id, 1);
        std::size_t index = Raffle::selectWinnerIndex(expected.front(), players.size());
        auto delivered = h.coordinator->fulfillRandomWords(id);
        if (delivered != expected) {
            fail("mock words are not reproducible");
        }
        if (*h.lottery->getRecentWinner() != players[index]) {
            fail("winner does not match the recomputed index");
        }
        if (h.book->balanceOf(players[index]) != 50) {
            fail("five-player pot not paid in full");
        }

        // The next round runs on the reset clock.
        h.lottery->enter("p9", 10);
        if (h.lottery->checkUpkeep().needed) {
            fail("new round triggered before its interval");
        }
        RequestId second = h.openAndTrigger({});
        if (second == id) {
            fail("request ids must not repeat");
        }
        h.coordinator->fulfillRandomWords(second);
        if (*h.lottery->getRecentWinner() != "p9" || h.book->balanceOf("p9") != 10) {
            fail("single-player round not paid to its only entrant");
        }
    }

    // Callback validation.
    {
        Harness h;
        if (!throws<FulfillmentNotExpectedError>([&] {
                h.lottery->rawFulfillRandomWords(h.coordinator->getAddress(), 1, { RandomWord(1) });
            })) {
            fail("fulfillment accepted while open");
        }

        RequestId id = h.openAndTrigger({ "alice", "bob" });
        if (!throws<OnlyCoordinatorCanFulfillError>(
                [&] { h.lottery->rawFulfillRandomWords("mallory", id, { RandomWord(0) }); })) {
            fail("fulfillment accepted from a non-coordinator caller");
        }
        bool mismatch = false;
        try {
            h.lottery->rawFulfillRandomWords(h.coordinator->getAddress(), id + 1, { RandomWord(0) });
        } catch (const UnknownRequestError& ex) {
            mismatch = ex.received() == id + 1 && ex.pending() == id;
        }
        if (!mismatch) {
            fail("mismatched request id not rejected with context");
        }
        if (!throws<InvalidRandomWordsError>(
                [&] { h.lottery->rawFulfillRandomWords(h.coordinator->getAddress(), id, {}); })) {
            fail("empty word list accepted");
        }
        if (h.lottery->getRaffleState() != RaffleState::CALCULATING ||
            h.lottery->getNumberOfPlayers() != 2 || h.lottery->getBalance() != 20) {
            fail("rejected callbacks changed the round");
        }

        h.coordinator->fulfillRandomWordsWithOverride(id, { RandomWord(4) });
        if (*h.lottery->getRecentWinner() != "alice") {
            fail("valid callback after rejected ones did not resolve the round");
        }
    }

    // A failing coordinator leaves the round open and intact.
    {
        Harness h;
        h.lottery->enter("alice", 10);
        h.clock->advance(31);
        h.coordinator->failNextRequest();
        if (!throws<std::runtime_error>([&] { h.lottery->performUpkeep(); })) {
            fail("coordinator failure not propagated");
        }
        if (h.lottery->getRaffleState() != RaffleState::OPEN ||
            h.lottery->getPendingRequestId() || h.lottery->getNumberOfPlayers() != 1) {
            fail("coordinator failure left the round locked");
        }
        if (h.lottery->getEventLog().size() != 1) {
            fail("failed trigger emitted an event");
        }
        if (!h.lottery->checkUpkeep().needed) {
            fail("round cannot be retriggered after a coordinator failure");
        }
        h.lottery->performUpkeep();
    }

    std::cout << "raffle_lifecycle_test passed" << std::endl;
    return 0;
}
