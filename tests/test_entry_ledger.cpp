#include "entry_ledger.hpp"

#include <cstdlib>
#include <iostream>
#include <limits>
#include <stdexcept>
#include <string>

namespace {

[[noreturn]] void fail(const std::string& msg) {
    std::cerr << "entry_ledger_test failure: " << msg << std::endl;
    std::exit(1);
}

} // namespace

int main() {
    using namespace raffle;

    EntryLedger ledger;
    if (!ledger.empty() || ledger.balance() != 0) {
        fail("new ledger should be empty");
    }

    ledger.add("alice", Wei(100));
    ledger.add("bob", Wei(250));
    ledger.add("alice", Wei(100));

    if (ledger.size() != 3) {
        fail("repeat entries should each take a slot");
    }
    if (ledger.participantAt(0) != "alice" || ledger.participantAt(1) != "bob" ||
        ledger.participantAt(2) != "alice") {
        fail("entry order not preserved");
    }
    if (ledger.balance() != Wei(450)) {
        fail("balance should be the sum of every amount paid in");
    }

    try {
        (void)ledger.participantAt(3);
        fail("index past the end should throw");
    } catch (const std::out_of_range&) {
    }

    try {
        ledger.add("", Wei(1));
        fail("empty participant address should be rejected");
    } catch (const std::invalid_argument&) {
    }

    EntryLedger full;
    full.add("whale", std::numeric_limits<Wei>::max());
    try {
        full.add("minnow", Wei(1));
        fail("pool overflow should be rejected");
    } catch (const std::overflow_error&) {
    }
    if (full.size() != 1 || full.balance() != std::numeric_limits<Wei>::max()) {
        fail("rejected entry must leave the ledger unchanged");
    }

    ledger.clear();
    if (!ledger.empty() || ledger.balance() != 0) {
        fail("clear should drop every entry and the balance");
    }

    std::cout << "entry ledger tests passed\n";
    return 0;
}
