#include "payout.hpp"
#include "raffle.hpp"
#include "raffle_config.hpp"
#include "raffle_errors.hpp"
#include "round_clock.hpp"
#include "upkeep_scheduler.hpp"
#include "vrf_coordinator.hpp"

#include <cstdint>
#include <exception>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>

using namespace raffle;

namespace {

void printHelp() {
    std::cout << "Commands:\n"
              << "  fund <account> <amount>   credit an account\n"
              << "  enter <account> [amount]  pay into the raffle (default: entrance fee)\n"
              << "  warp <seconds>            advance the clock\n"
              << "  poll                      run one automation poll\n"
              << "  fulfill                   let the coordinator answer the pending request\n"
              << "  status                    show the round\n"
              << "  quit\n";
}

void printStatus(const Raffle& lottery, const AccountBook& book, const ManualClock& clock) {
    std::cout << "State: " << toString(lottery.getRaffleState()) << "  now=" << clock.now()
              << "  round start=" << lottery.getLastTimeStamp() << "\n";
    std::cout << "Pot: " << lottery.getBalance() << "  players: " << lottery.getNumberOfPlayers()
              << "\n";
    for (std::size_t i = 0; i < lottery.getNumberOfPlayers(); ++i) {
        const Address& player = lottery.getPlayer(i);
        std::cout << "  [" << i << "] " << player << " (balance " << book.balanceOf(player)
                  << ")\n";
    }
    if (lottery.getRecentWinner()) {
        std::cout << "Recent winner: " << *lottery.getRecentWinner() << "\n";
    }
    if (auto pending = lottery.getPendingRequestId()) {
        std::cout << "Pending request: " << *pending << "\n";
    }
    std::cout << "Event log root: " << lottery.getEventLog().merkleRoot() << "\n";
}

void printFulfillment(const VrfFulfillment& record, const std::string& publicKey) {
    std::cout << "\n=== VERIFIABLE DRAW ===\n";
    std::cout << "Request id: " << record.requestId << "\n";
    std::cout << "VRF input (alpha): " << record.alpha << "\n";
    std::cout << "VRF proof: " << record.proofHex << "\n";
    std::cout << "VRF output: " << record.outputHex << "\n";
    std::cout << "Random word: " << record.words.front() << "\n";
    bool ok = VrfCoordinator::verify(record.proofHex, record.outputHex, publicKey, record.alpha);
    std::cout << "VRF verification: " << (ok ? "valid" : "INVALID") << "\n";
}

} // namespace

int main() {
    RaffleConfig cfg;
    DeploymentScope scope;
    try {
        cfg = loadConfigFromEnvironment();
        scope = requireDeploymentScope();
    } catch (const std::exception& ex) {
        std::cerr << "Configuration error: " << ex.what() << "\n";
        return 1;
    }

    VrfKeyPair keys = generateVrfKeypair();
    auto coordinator = std::make_shared<VrfCoordinator>(
        "vrf-coordinator", keys.secretKeyHex, keys.publicKeyHex, scope.deploymentId, scope.chainId);
    auto book = std::make_shared<AccountBook>();
    auto clock = std::make_shared<ManualClock>(1);
    Raffle lottery(cfg, coordinator, book, clock);
    UpkeepScheduler scheduler(lottery);

    lottery.subscribe([](const RaffleEvent& event) {
        std::cout << "  event: " << describeEvent(event) << "\n";
    });

    std::cout << "Fair raffle simulator.\n";
    std::cout << "Coordinator VRF public key: " << keys.publicKeyHex << "\n";
    std::cout << "Entrance fee: " << cfg.entranceFee << "  interval: " << cfg.intervalSeconds
              << "s  deployment: " << scope.deploymentId;
    if (!scope.chainId.empty()) {
        std::cout << " | " << scope.chainId;
    }
    std::cout << "\n";
    printHelp();

    std::string line;
    while (std::cout << "> " && std::getline(std::cin, line)) {
        std::istringstream iss(line);
        std::string command;
        if (!(iss >> command)) {
            continue;
        }

        try {
            if (command == "quit" || command == "exit") {
                break;
            } else if (command == "help") {
                printHelp();
            } else if (command == "fund") {
                std::string account;
                Amount amount = 0;
                if (!(iss >> account >> amount)) {
                    std::cout << "Usage: fund <account> <amount>\n";
                    continue;
                }
                book->fund(account, amount);
            } else if (command == "enter") {
                std::string account;
                if (!(iss >> account)) {
                    std::cout << "Usage: enter <account> [amount]\n";
                    continue;
                }
                Amount amount = 0;
                if (!(iss >> amount)) {
                    amount = cfg.entranceFee;
                }
                book->withdraw(account, amount);
                try {
                    lottery.enter(account, amount);
                } catch (const std::exception&) {
                    book->fund(account, amount);
                    throw;
                }
            } else if (command == "warp") {
                std::uint64_t seconds = 0;
                if (!(iss >> seconds)) {
                    std::cout << "Usage: warp <seconds>\n";
                    continue;
                }
                clock->advance(seconds);
            } else if (command == "poll") {
                auto id = scheduler.poll();
                if (!id) {
                    UpkeepCheck check = lottery.checkUpkeep();
                    std::cout << "Upkeep not needed (time=" << check.timePassed
                              << " open=" << check.isOpen << " balance=" << check.hasBalance
                              << " players=" << check.hasPlayers << ")\n";
                }
            } else if (command == "fulfill") {
                auto pending = lottery.getPendingRequestId();
                if (!pending) {
                    std::cout << "No request is pending.\n";
                    continue;
                }
                try {
                    auto record = coordinator->fulfillRandomWords(*pending);
                    printFulfillment(record, keys.publicKeyHex);
                } catch (const PayoutTransferFailedError& ex) {
                    printFulfillment(coordinator->getFulfillments().back(), keys.publicKeyHex);
                    std::cout << "Payout failed: " << ex.what() << "\n";
                }
            } else if (command == "status") {
                printStatus(lottery, *book, *clock);
            } else {
                std::cout << "Unknown command. Type help.\n";
            }
        } catch (const std::exception& ex) {
            std::cout << "Error: " << ex.what() << "\n";
        }
    }

    std::cout << "Final event log root: " << lottery.getEventLog().merkleRoot() << "\n";
    return 0;
}
