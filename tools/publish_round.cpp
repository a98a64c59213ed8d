#include "encoding.hpp"
#include "raffle_config.hpp"
#include "round_publication.hpp"

#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

// Signs the event log root of a finished round so observers can pin it.
int main(int argc, char* argv[]) {
    if (argc < 4) {
        std::cerr << "Usage: publish_round <round_number> <event_merkle_root> <ed25519_secret_key_hex> [output.json]\n";
        std::cerr << "The deployment scope comes from RAFFLE_DEPLOYMENT_ID and RAFFLE_CHAIN_ID.\n";
        return 1;
    }

    std::string json;
    try {
        raffle::RaffleConfig cfg = raffle::loadRaffleConfigFromEnv();
        std::uint64_t round = raffle::parseUnsignedDecimal("round_number", raffle::trim(argv[1]));
        raffle::RoundPublication publication =
            raffle::signRoundPublication(cfg, round, raffle::trim(argv[2]), raffle::trim(argv[3]));
        json = raffle::toJson(publication);
    } catch (const std::exception& ex) {
        std::cerr << "Refusing to sign: " << ex.what() << "\n";
        return 1;
    }

    if (argc < 5) {
        std::cout << json;
        return 0;
    }
    std::ofstream ofs(argv[4]);
    if (!ofs) {
        std::cerr << "Unable to open output path: " << argv[4] << "\n";
        return 1;
    }
    ofs << json;
    return 0;
}
