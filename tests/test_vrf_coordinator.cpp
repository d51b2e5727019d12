#include "payout.hpp"
#include "raffle.hpp"
#include "round_clock.hpp"
#include "vrf_coordinator.hpp"

#include <cstdlib>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

namespace {

[[noreturn]] void fail(const std::string& msg) {
    std::cerr << "vrf_coordinator_test failure: " << msg << std::endl;
    std::exit(1);
}

const std::string kSeedHex =
    "000102030405060708090a0b0c0d0e0f000102030405060708090a0b0c0d0e0f";

std::shared_ptr<raffle::VrfCoordinator> makeCoordinator(const std::string& deploymentId) {
    auto keys = raffle::deriveVrfKeypairFromSeed(kSeedHex);
    return std::make_shared<raffle::VrfCoordinator>(
        "vrf-coordinator", keys.secretKeyHex, keys.publicKeyHex, deploymentId, "test-chain");
}

} // namespace

int main() {
    using namespace raffle;

    auto keysA = deriveVrfKeypairFromSeed(kSeedHex);
    auto keysB = deriveVrfKeypairFromSeed(kSeedHex);
    if (keysA.publicKeyHex != keysB.publicKeyHex || keysA.secretKeyHex != keysB.secretKeyHex) {
        fail("seeded key derivation is not deterministic");
    }
    auto fresh = generateVrfKeypair();
    bool mismatchRejected = false;
    try {
        VrfCoordinator bad("vrf", keysA.secretKeyHex, fresh.publicKeyHex, "suite");
    } catch (const std::invalid_argument&) {
        mismatchRejected = true;
    }
    if (!mismatchRejected) {
        fail("coordinator accepted a public key that does not match its secret");
    }
    bool scopeRejected = false;
    try {
        VrfCoordinator bad("vrf", keysA.secretKeyHex, keysA.publicKeyHex, "");
    } catch (const std::invalid_argument&) {
        scopeRejected = true;
    }
    if (!scopeRejected) {
        fail("coordinator accepted an empty deployment scope");
    }

    RaffleConfig cfg;
    cfg.entranceFee = 10;
    cfg.intervalSeconds = 30;

    // Full round through the VRF coordinator, then an independent audit.
    auto coordinator = makeCoordinator("vrf-suite");
    auto book = std::make_shared<AccountBook>();
    auto clock = std::make_shared<ManualClock>(1000);
    Raffle lottery(cfg, coordinator, book, clock);

    lottery.enter("alice", 10);
    lottery.enter("bob", 10);
    lottery.enter("carol", 10);
    clock->advance(30);
    RequestId id = lottery.performUpkeep();

    RandomWordsRequest invalid;
    invalid.keyHash = cfg.keyHash;
    invalid.requestConfirmations = 1;
    invalid.callbackGasLimit = cfg.callbackGasLimit;
    invalid.numWords = 1;
    bool requestRejected = false;
    try {
        coordinator->requestRandomWords(invalid, lottery);
    } catch (const std::invalid_argument&) {
        requestRejected = true;
    }
    if (!requestRejected || coordinator->pendingCount() != 1) {
        fail("coordinator queued a request below the confirmation floor");
    }

    VrfFulfillment record = coordinator->fulfillRandomWords(id);
    if (record.requestId != id || record.words.size() != 1) {
        fail("fulfillment record incomplete");
    }
    if (!VrfCoordinator::verify(record.proofHex, record.outputHex, keysA.publicKeyHex, record.alpha)) {
        fail("fulfillment proof does not verify");
    }
    RandomWordsRequest original;
    original.keyHash = cfg.keyHash;
    original.subscriptionId = cfg.subscriptionId;
    if (record.alpha != VrfCoordinator::buildAlpha("vrf-suite", "test-chain", id, original)) {
        fail("alpha not reproducible from public request data");
    }
    if (VrfCoordinator::deriveWords(record.outputHex, 1) != record.words) {
        fail("words not reproducible from the VRF output");
    }
    std::size_t index = Raffle::selectWinnerIndex(record.words.front(), 3);
    const char* players[] = { "alice", "bob", "carol" };
    if (*lottery.getRecentWinner() != players[index] || book->balanceOf(players[index]) != 30) {
        fail("winner does not match the audited index");
    }

    // Tampering with any artifact breaks verification.
    std::string tamperedOutput = record.outputHex;
    tamperedOutput[0] = tamperedOutput[0] == '0' ? '1' : '0';
    if (VrfCoordinator::verify(record.proofHex, tamperedOutput, keysA.publicKeyHex, record.alpha)) {
        fail("tampered output accepted");
    }
    if (VrfCoordinator::verify(record.proofHex, record.outputHex, fresh.publicKeyHex, record.alpha)) {
        fail("proof accepted under a different key");
    }
    if (VrfCoordinator::verify(record.proofHex, record.outputHex, keysA.publicKeyHex,
                               record.alpha + "x")) {
        fail("proof accepted for a different alpha");
    }
    if (VrfCoordinator::verify("zz", record.outputHex, keysA.publicKeyHex, record.alpha)) {
        fail("malformed proof accepted");
    }

    bool replayRejected = false;
    try {
        coordinator->fulfillRandomWords(id);
    } catch (const std::invalid_argument&) {
        replayRejected = true;
    }
    if (!replayRejected || coordinator->getFulfillments().size() != 1) {
        fail("coordinator fulfilled the same request twice");
    }

    // Domain separation: same key and request id, different deployment.
    auto other = makeCoordinator("other-suite");
    Raffle otherLottery(cfg, other, book, clock);
    otherLottery.enter("dave", 10);
    clock->advance(30);
    RequestId otherId = otherLottery.performUpkeep();
    auto otherRecord = other->fulfillRandomWords(otherId);
    if (otherId == id && otherRecord.outputHex == record.outputHex) {
        fail("deployments share VRF outputs");
    }

    // Records stay auditable from public data once the coordinator is gone.
    VrfFulfillment kept;
    RequestId keptId = 0;
    {
        auto scoped = makeCoordinator("long-lived-deployment-identifier-for-audits");
        Raffle scopedLottery(cfg, scoped, book, clock);
        scopedLottery.enter("erin", 10);
        clock->advance(30);
        keptId = scopedLottery.performUpkeep();
        kept = scoped->fulfillRandomWords(keptId);
    }
    if (kept.alpha != VrfCoordinator::buildAlpha("long-lived-deployment-identifier-for-audits",
                                                 "test-chain", keptId, original) ||
        !VrfCoordinator::verify(kept.proofHex, kept.outputHex, keysA.publicKeyHex, kept.alpha)) {
        fail("fulfillment record not auditable after the coordinator was released");
    }

    std::cout << "vrf_coordinator_test passed" << std::endl;
    return 0;
}
