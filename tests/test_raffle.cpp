#include "clock.hpp"
#include "raffle.hpp"
#include "raffle_errors.hpp"
#include "value_transfer.hpp"
#include "vrf_coordinator.hpp"

#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

using namespace raffle;

namespace {

[[noreturn]] void fail(const std::string& msg) {
    std::cerr << "raffle_test failure: " << msg << std::endl;
    std::exit(1);
}

template <typename Error, typename Fn>
void expectThrows(const std::string& what, Fn&& fn) {
    try {
        fn();
    } catch (const Error&) {
        return;
    }
    fail(what + ": expected exception was not thrown");
}

const std::string kSeedHex = "000102030405060708090a0b0c0d0e0f000102030405060708090a0b0c0d0e0f";

// One local deployment: clock, balances, VRF gateway and the raffle itself.
struct Deployment {
    explicit Deployment(std::uint64_t interval)
        : clock(1'700'000'000)
        , vrf(deriveVrfKeypairFromSeed(kSeedHex), "raffle-tests", "31337")
        , raffle(makeConfig(interval), "0xraffle", vrf, book, clock) {
        vrf.addConsumer(raffle.getConfig().subscriptionId, raffle.getAddress());
    }

    RaffleConfig makeConfig(std::uint64_t interval) {
        RaffleConfig cfg;
        cfg.entranceFee = parseEther("0.01");
        cfg.interval = interval;
        cfg.deploymentId = "raffle-tests";
        cfg.subscriptionId = vrf.createSubscription();
        return cfg;
    }

    ManualClock clock;
    AccountBook book;
    LocalVrfCoordinator vrf;
    Raffle raffle;
};

} // namespace

int main() {
    const Wei fee = parseEther("0.01");

    expectThrows<std::invalid_argument>("invalid configuration", [] {
        ManualClock clock(0);
        AccountBook book;
        LocalVrfCoordinator vrf(deriveVrfKeypairFromSeed(kSeedHex), "raffle-tests");
        RaffleConfig cfg;
        cfg.interval = 0;
        Raffle bad(cfg, "0xraffle", vrf, book, clock);
    });

    // Fee 0.01, interval 300, A B C D enter, random value 7 picks D.
    {
        Deployment d(300);
        Raffle& raffle = d.raffle;
        const Timestamp deployedAt = d.clock.now();

        if (raffle.getEntranceFee() != fee || raffle.getInterval() != 300 ||
            raffle.getRaffleState() != RaffleState::OPEN || raffle.getLatestTimestamp() != deployedAt) {
            fail("fresh deployment getters");
        }
        if (raffle.getRequestConfirmations() != 3 || raffle.getNumWords() != 1) {
            fail("request constants");
        }
        if (!raffle.getRecentWinner().empty()) {
            fail("no winner before the first draw");
        }

        expectThrows<InsufficientDeposit>("entering without the fee", [&] { raffle.enterRaffle("A", Wei(0)); });

        for (const char* player : { "A", "B", "C", "D" }) {
            d.book.credit(player, fee);
            raffle.enterRaffle(player, fee);
        }
        if (raffle.getNumberOfPlayers() != 4 || raffle.getPlayer(3) != "D" || raffle.getPoolBalance() != fee * 4) {
            fail("entries not recorded");
        }
        if (d.book.balanceOf(raffle.getAddress()) != fee * 4 || d.book.balanceOf("A") != 0) {
            fail("entry fees should move from the players to the raffle");
        }
        if (raffle.getEvents().countOf(EventKind::RAFFLE_ENTER) != 4) {
            fail("each entry should emit RaffleEnter");
        }
        expectThrows<std::out_of_range>("player index past the end", [&] { (void)raffle.getPlayer(4); });

        if (raffle.checkUpkeep("").upkeepNeeded) {
            fail("upkeep before the interval");
        }
        expectThrows<UpkeepNotNeeded>("perform before the interval", [&] { raffle.performUpkeep(""); });

        d.clock.advance(300);
        if (raffle.checkUpkeep("").upkeepNeeded) {
            fail("exactly one interval is not enough");
        }
        d.clock.advance(1);
        if (!raffle.checkUpkeep("").upkeepNeeded) {
            fail("upkeep should be needed one second later");
        }

        raffle.performUpkeep("");
        if (raffle.getRaffleState() != RaffleState::CALCULATING || raffle.getPendingRequestId() != RequestId(1)) {
            fail("perform should request a draw with id 1");
        }
        expectThrows<RoundNotOpen>("entering while calculating", [&] { raffle.enterRaffle("E", fee); });
        if (raffle.checkUpkeep("").upkeepNeeded) {
            fail("no upkeep while calculating");
        }

        FulfillmentReceipt receipt = d.vrf.fulfillRandomWordsWithOverride(1, { RandomWord(7) });
        if (!receipt.success || receipt.consumer != raffle.getAddress()) {
            fail("fulfillment rejected: " + receipt.failureReason);
        }

        if (raffle.getRecentWinner() != "D") {
            fail("7 mod 4 should pick D, got " + raffle.getRecentWinner());
        }
        if (d.book.balanceOf("D") != parseEther("0.04")) {
            fail("D should receive 0.04 ether, got " + formatEther(d.book.balanceOf("D")));
        }
        if (d.book.balanceOf(raffle.getAddress()) != 0) {
            fail("payout should drain the raffle");
        }
        if (raffle.getRaffleState() != RaffleState::OPEN || raffle.getNumberOfPlayers() != 0 ||
            raffle.getPoolBalance() != 0 || raffle.getLatestTimestamp() != deployedAt + 301) {
            fail("round should reopen empty, stamped at fulfillment");
        }
        const RaffleEvent& picked = raffle.getEvents().back();
        if (picked.kind != EventKind::WINNER_PICKED || picked.account != "D" || picked.amount != fee * 4) {
            fail("WinnerPicked not emitted");
        }

        try {
            d.vrf.fulfillRandomWords(1);
            fail("fulfilling a consumed request should throw");
        } catch (const UnknownRequest& err) {
            if (std::string(err.what()).find("nonexistent request") == std::string::npos) {
                fail("unexpected message: " + std::string(err.what()));
            }
        }
    }

    // Fulfilling while open is rejected by the callback without touching the round.
    {
        Deployment d(30);
        d.book.credit("A", fee);
        d.raffle.enterRaffle("A", fee);
        expectThrows<RoundNotCalculating>("callback while open", [&] {
            d.raffle.consumer().rawFulfillRandomWords(d.vrf, 1, { RandomWord(7) });
        });
        expectThrows<UnknownRequest>("gateway fulfill without a request", [&] { d.vrf.fulfillRandomWords(1); });
        if (d.raffle.getNumberOfPlayers() != 1 || d.raffle.getRaffleState() != RaffleState::OPEN) {
            fail("rejected fulfillment mutated the round");
        }
    }

    // Refused payout: the gateway consumes the request, the round stays calculating.
    {
        Deployment d(30);
        d.book.credit("A", fee);
        d.raffle.enterRaffle("A", fee);
        d.clock.advance(31);
        d.raffle.performUpkeep("");
        const std::size_t eventsBefore = d.raffle.getEvents().size();

        d.book.rejectPayments("A");
        FulfillmentReceipt receipt = d.vrf.fulfillRandomWords(1);
        if (receipt.success || receipt.failureReason.find("Raffle__TransferFailed") == std::string::npos) {
            fail("receipt should report the refused payout");
        }
        if (d.vrf.isPending(1)) {
            fail("gateway should consume the request even when the consumer fails");
        }
        if (d.raffle.getRaffleState() != RaffleState::CALCULATING || d.raffle.getNumberOfPlayers() != 1 ||
            d.raffle.getEvents().size() != eventsBefore) {
            fail("refused payout should leave the round calculating and the log unchanged");
        }
        if (d.raffle.checkUpkeep("").upkeepNeeded) {
            fail("stuck round must not ask for another draw");
        }
        if (d.book.balanceOf("0xraffle") != fee || d.book.balanceOf("A") != 0) {
            fail("the raffle should keep the pool while the payout is refused");
        }
    }

    // Successive rounds with VRF-derived words.
    {
        Deployment d(60);
        const std::vector<std::vector<std::string>> rounds{
            { "alice", "bob" },
            { "carol" },
            { "dave", "erin", "frank", "alice" },
        };

        Wei paidOut = 0;
        std::uint64_t entries = 0;
        for (std::size_t r = 0; r < rounds.size(); ++r) {
            for (const auto& player : rounds[r]) {
                d.book.credit(player, fee);
                d.raffle.enterRaffle(player, fee);
                ++entries;
            }
            d.clock.advance(61);
            d.raffle.performUpkeep("");
            RequestId id = *d.raffle.getPendingRequestId();
            if (id != r + 1) {
                fail("request ids should be sequential from 1");
            }

            FulfillmentReceipt receipt = d.vrf.fulfillRandomWords(id);
            if (!receipt.success) {
                fail("round " + std::to_string(r) + " fulfillment failed: " + receipt.failureReason);
            }
            if (!LocalVrfCoordinator::verifyProof(
                    receipt.vrfProofHex, receipt.vrfOutputHex, d.vrf.getPublicKey(), receipt.alpha)) {
                fail("VRF proof should verify");
            }

            std::size_t expected = DrawCoordinator::selectWinnerIndex(receipt.randomWords.front(), rounds[r].size());
            if (d.raffle.getRecentWinner() != rounds[r][expected]) {
                fail("winner does not match the delivered word");
            }
            paidOut += fee * rounds[r].size();
            if (d.raffle.getRoundNumber() != r + 1 || d.raffle.getNumberOfPlayers() != 0) {
                fail("round did not reset");
            }
        }

        Wei total = 0;
        for (const char* player : { "alice", "bob", "carol", "dave", "erin", "frank" }) {
            total += d.book.balanceOf(player);
        }
        if (total != paidOut || d.book.balanceOf("0xraffle") != 0 || total != d.book.totalSupply()) {
            fail("every pool should be paid out exactly once");
        }
        if (d.book.getTransferCount() != entries + rounds.size()) {
            fail("one transfer per entry and one per payout");
        }
        if (d.raffle.getEvents().countOf(EventKind::WINNER_PICKED) != rounds.size() ||
            d.raffle.getEvents().countOf(EventKind::REQUESTED_RAFFLE_WINNER) != rounds.size()) {
            fail("one request and one winner event per round");
        }
    }

    // Value is conserved: the winner ends at start - fee + pool and the raffle holds nothing.
    {
        Deployment d(30);
        const Wei start = parseEther("1");
        for (const char* player : { "A", "B", "C" }) {
            d.book.credit(player, start);
        }
        const Wei supply = d.book.totalSupply();

        d.book.credit("broke", fee - 1);
        const std::string rootBefore = d.raffle.getEvents().merkleRoot();
        try {
            d.raffle.enterRaffle("broke", fee);
            fail("entrant without funds should be refused");
        } catch (const DepositFailed& err) {
            if (err.getPlayer() != "broke" || err.getAmount() != fee) {
                fail("DepositFailed should name the player and the amount");
            }
        }
        if (d.raffle.getNumberOfPlayers() != 0 || d.raffle.getPoolBalance() != 0 ||
            d.raffle.getEvents().merkleRoot() != rootBefore || d.book.balanceOf("broke") != fee - 1) {
            fail("refused deposit should leave no trace");
        }

        for (const char* player : { "A", "B", "C" }) {
            d.raffle.enterRaffle(player, fee);
        }
        const Wei pool = d.raffle.getPoolBalance();
        if (pool != fee * 3 || d.book.balanceOf("0xraffle") != pool) {
            fail("the raffle should hold exactly the pool");
        }

        d.clock.advance(31);
        d.raffle.performUpkeep("");
        FulfillmentReceipt receipt = d.vrf.fulfillRandomWordsWithOverride(1, { RandomWord(4) });
        if (!receipt.success || d.raffle.getRecentWinner() != "B") {
            fail("4 mod 3 should pick B");
        }
        if (d.book.balanceOf("B") != start - fee + pool) {
            fail("winner should end at start - fee + pool, got " + formatEther(d.book.balanceOf("B")));
        }
        if (d.book.balanceOf("A") != start - fee || d.book.balanceOf("C") != start - fee) {
            fail("losers should be down exactly one fee");
        }
        if (d.book.balanceOf("0xraffle") != 0 || d.book.totalSupply() != supply + fee - 1) {
            fail("no value should be created or destroyed");
        }
    }

    // A winner re-entering from its receive hook lands after WinnerPicked, in the next round.
    {
        Deployment d(30);
        d.book.credit("A", fee);
        d.book.credit("B", fee);
        d.raffle.enterRaffle("A", fee);
        d.raffle.enterRaffle("B", fee);
        d.clock.advance(31);
        d.raffle.performUpkeep("");

        d.book.setReceiveHook("A", [&](const Address& to, const Wei&) {
            d.raffle.enterRaffle(to, fee);
            return true;
        });
        FulfillmentReceipt receipt = d.vrf.fulfillRandomWordsWithOverride(1, { RandomWord(0) });
        if (!receipt.success || d.raffle.getRecentWinner() != "A") {
            fail("0 mod 2 should pick A: " + receipt.failureReason);
        }

        const auto& events = d.raffle.getEvents().events();
        const RaffleEvent& last = events.back();
        const RaffleEvent& picked = events[events.size() - 2];
        if (picked.kind != EventKind::WINNER_PICKED || picked.round != 0) {
            fail("WinnerPicked should precede the re-entry");
        }
        if (last.kind != EventKind::RAFFLE_ENTER || last.account != "A" || last.round != 1) {
            fail("re-entry should be logged against the next round");
        }
        if (d.raffle.getNumberOfPlayers() != 1 || d.book.balanceOf("A") != fee ||
            d.book.balanceOf("0xraffle") != fee) {
            fail("re-entry should pay one fee out of the prize");
        }
    }

    std::cout << "raffle tests passed\n";
    return 0;
}
