#include "clock.hpp"
#include "raffle.hpp"
#include "raffle_config.hpp"
#include "raffle_errors.hpp"
#include "units.hpp"
#include "value_transfer.hpp"
#include "vrf_coordinator.hpp"

#include <cstdlib>
#include <iostream>
#include <sstream>
#include <string>
#include <utility>

using namespace raffle;

namespace {

void printHelp() {
    std::cout << "Commands:\n"
              << "  fund <account> <ether>   mint funds into an account\n"
              << "  enter <player> <ether>   join the current round\n"
              << "  wait <seconds>           advance the local clock\n"
              << "  check                    evaluate upkeep without acting\n"
              << "  upkeep                   perform upkeep (request a draw)\n"
              << "  fulfill [requestId]      deliver VRF randomness for a pending request\n"
              << "  status                   show the round\n"
              << "  events                   show the event log and its Merkle root\n"
              << "  quit\n";
}

void printStatus(const Raffle& raffle, const AccountBook& book, const ManualClock& clock) {
    std::cout << "Round " << raffle.getRoundNumber() << "  state=" << toString(raffle.getRaffleState())
              << "  players=" << raffle.getNumberOfPlayers()
              << "  pool=" << formatEther(raffle.getPoolBalance()) << " ether"
              << "  held=" << formatEther(book.balanceOf(raffle.getAddress())) << " ether\n";
    for (std::size_t i = 0; i < raffle.getNumberOfPlayers(); ++i) {
        std::cout << "  [" << i << "] " << raffle.getPlayer(i) << "\n";
    }
    std::cout << "  now=" << clock.now() << "  lastDraw=" << raffle.getLatestTimestamp()
              << "  interval=" << raffle.getInterval() << "s\n";
    if (auto pending = raffle.getPendingRequestId()) {
        std::cout << "  pending request: " << *pending << "\n";
    }
    std::string winner = raffle.getRecentWinner();
    if (!winner.empty()) {
        std::cout << "  recent winner: " << winner << " (balance " << formatEther(book.balanceOf(winner))
                  << " ether)\n";
    }
}

void printEvents(const EventLog& events, std::size_t from) {
    for (std::size_t i = from; i < events.size(); ++i) {
        const auto& event = events.events()[i];
        std::cout << "  #" << i << " " << toString(event.kind) << " round=" << event.round;
        switch (event.kind) {
        case EventKind::RAFFLE_ENTER:
            std::cout << " player=" << event.account << " amount=" << formatEther(event.amount);
            break;
        case EventKind::REQUESTED_RAFFLE_WINNER:
            std::cout << " requestId=" << event.requestId;
            break;
        case EventKind::WINNER_PICKED:
            std::cout << " winner=" << event.account << " prize=" << formatEther(event.amount);
            break;
        }
        std::cout << "\n";
    }
}

int runSession(RaffleConfig cfg) {
    if (!isDevelopmentChain(cfg.networkName)) {
        std::cerr << "raffle_cli only simulates development chains; " << cfg.networkName
                  << " needs the live VRF and automation networks\n";
        return 1;
    }

    const char* seedEnv = std::getenv("RAFFLE_VRF_SEED");
    VrfKeyPair keys = seedEnv ? deriveVrfKeypairFromSeed(seedEnv) : generateVrfKeypair();

    SystemClock wallClock;
    ManualClock clock(wallClock.now());
    AccountBook book;
    LocalVrfCoordinator coordinator(keys, cfg.deploymentId, std::to_string(cfg.chainId));
    cfg.subscriptionId = coordinator.createSubscription();

    const Address raffleAddress = "0x" + cfg.deploymentId + "-raffle";
    Raffle raffle(cfg, raffleAddress, coordinator, book, clock);
    coordinator.addConsumer(cfg.subscriptionId, raffle.getAddress());

    std::cout << "entropy-raffle on " << cfg.networkName << " (chain " << cfg.chainId << ")\n";
    std::cout << "Entrance fee: " << formatEther(raffle.getEntranceFee()) << " ether, interval "
              << raffle.getInterval() << "s, subscription " << cfg.subscriptionId << "\n";
    std::cout << "VRF public key: " << coordinator.getPublicKey() << "\n";
    printHelp();

    std::size_t eventCursor = 0;
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
                std::string amount;
                if (!(iss >> account >> amount)) {
                    std::cout << "usage: fund <account> <ether>\n";
                    continue;
                }
                book.credit(account, parseEther(amount));
                std::cout << account << " balance " << formatEther(book.balanceOf(account)) << " ether\n";
            } else if (command == "enter") {
                std::string player;
                std::string amount;
                if (!(iss >> player >> amount)) {
                    std::cout << "usage: enter <player> <ether>\n";
                    continue;
                }
                raffle.enterRaffle(player, parseEther(amount));
            } else if (command == "wait") {
                std::uint64_t seconds = 0;
                if (!(iss >> seconds)) {
                    std::cout << "usage: wait <seconds>\n";
                    continue;
                }
                clock.advance(seconds);
            } else if (command == "check") {
                UpkeepCheck check = raffle.inspectUpkeep();
                std::cout << "upkeepNeeded=" << std::boolalpha << check.upkeepNeeded << " open=" << check.isOpen
                          << " timePassed=" << check.timePassed << " hasPlayers=" << check.hasPlayers
                          << " hasBalance=" << check.hasBalance << "\n";
            } else if (command == "upkeep") {
                UpkeepResult result = raffle.checkUpkeep("");
                if (!result.upkeepNeeded) {
                    std::cout << "checkUpkeep returned false; performing anyway to show the guard\n";
                }
                raffle.performUpkeep(result.performData);
            } else if (command == "fulfill") {
                RequestId requestId = 0;
                if (!(iss >> requestId)) {
                    auto pending = coordinator.pendingRequests();
                    if (pending.empty()) {
                        std::cout << "no pending randomness requests\n";
                        continue;
                    }
                    requestId = pending.front();
                }
                FulfillmentReceipt receipt = coordinator.fulfillRandomWords(requestId);
                std::cout << "VRF output: " << receipt.vrfOutputHex << "\n";
                std::cout << "VRF proof verifies: "
                          << (LocalVrfCoordinator::verifyProof(
                                  receipt.vrfProofHex, receipt.vrfOutputHex, coordinator.getPublicKey(), receipt.alpha)
                                  ? "yes"
                                  : "NO")
                          << "\n";
                if (!receipt.success) {
                    std::cout << "consumer rejected fulfillment: " << receipt.failureReason << "\n";
                }
            } else if (command == "status") {
                printStatus(raffle, book, clock);
            } else if (command == "events") {
                printEvents(raffle.getEvents(), 0);
                std::cout << "Merkle root: " << raffle.getEvents().merkleRoot() << "\n";
                eventCursor = raffle.getEvents().size();
                continue;
            } else {
                std::cout << "unknown command; try help\n";
            }
        } catch (const RaffleError& err) {
            std::cout << "reverted: " << err.what() << "\n";
        } catch (const std::exception& ex) {
            std::cout << "error: " << ex.what() << "\n";
        }

        printEvents(raffle.getEvents(), eventCursor);
        eventCursor = raffle.getEvents().size();
    }

    std::cout << "Final event root: " << raffle.getEvents().merkleRoot() << "\n";
    return 0;
}

} // namespace

int main() {
    RaffleConfig cfg;
    try {
        cfg = loadRaffleConfigFromEnv();
    } catch (const std::exception& ex) {
        std::cerr << "Configuration error: " << ex.what() << "\n";
        return 1;
    }

    try {
        return runSession(std::move(cfg));
    } catch (const std::exception& ex) {
        std::cerr << "Fatal: " << ex.what() << "\n";
        return 1;
    }
}
