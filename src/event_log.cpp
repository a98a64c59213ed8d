#include "event_log.hpp"

#include "picosha2.h"

#include <stdexcept>
#include <utility>

namespace raffle {

namespace {

std::string hashBytes(const std::string& data) {
    std::vector<unsigned char> hash(picosha2::k_digest_size);
    picosha2::hash256(data.begin(), data.end(), hash.begin(), hash.end());
    return picosha2::bytes_to_hex_string(hash.begin(), hash.end());
}

std::string hashPairInternal(const std::string& left, const std::string& right) {
    return hashBytes(left + right);
}

void writeU64(std::string& out, std::uint64_t v) {
    for (int i = 0; i < 8; ++i) {
        out.push_back(static_cast<char>((v >> (8 * i)) & 0xFF));
    }
}

void writeU256(std::string& out, const Wei& v) {
    Wei rest = v;
    for (int i = 0; i < 32; ++i) {
        out.push_back(static_cast<char>(static_cast<unsigned>(rest & 0xFF)));
        rest >>= 8;
    }
}

void writeString(std::string& out, const std::string& s) {
    writeU64(out, static_cast<std::uint64_t>(s.size()));
    out.append(s);
}

} // namespace

const char* toString(EventKind kind) {
    switch (kind) {
    case EventKind::RAFFLE_ENTER:
        return "RaffleEnter";
    case EventKind::REQUESTED_RAFFLE_WINNER:
        return "RequestedRaffleWinner";
    case EventKind::WINNER_PICKED:
        return "WinnerPicked";
    }
    return "Unknown";
}

RaffleEvent RaffleEvent::raffleEnter(const Address& player, const Wei& amount, std::uint64_t round) {
    RaffleEvent event;
    event.kind = EventKind::RAFFLE_ENTER;
    event.account = player;
    event.amount = amount;
    event.round = round;
    return event;
}

RaffleEvent RaffleEvent::requestedRaffleWinner(RequestId requestId, std::uint64_t round) {
    RaffleEvent event;
    event.kind = EventKind::REQUESTED_RAFFLE_WINNER;
    event.requestId = requestId;
    event.round = round;
    return event;
}

RaffleEvent RaffleEvent::winnerPicked(const Address& winner, const Wei& amount, std::uint64_t round) {
    RaffleEvent event;
    event.kind = EventKind::WINNER_PICKED;
    event.account = winner;
    event.amount = amount;
    event.round = round;
    return event;
}

std::string encodeEvent(const RaffleEvent& event) {
    std::string out;
    out.reserve(64 + event.account.size());
    out.push_back(static_cast<char>(event.kind));
    writeU64(out, event.round);
    writeU64(out, event.requestId);
    writeU256(out, event.amount);
    writeString(out, event.account);
    return out;
}

void EventLog::append(const RaffleEvent& event) {
    leaves_.push_back(hash(encodeEvent(event)));
    events_.push_back(event);
}

void EventLog::truncate(std::size_t size) {
    if (size > events_.size()) {
        throw std::out_of_range("cannot truncate event log beyond its length");
    }
    events_.resize(size);
    leaves_.resize(size);
}

std::size_t EventLog::countOf(EventKind kind) const {
    std::size_t count = 0;
    for (const auto& event : events_) {
        if (event.kind == kind) {
            ++count;
        }
    }
    return count;
}

const RaffleEvent& EventLog::back() const {
    if (events_.empty()) {
        throw std::out_of_range("event log is empty");
    }
    return events_.back();
}

std::string EventLog::getLeaf(std::size_t index) const {
    if (index >= leaves_.size()) {
        return {};
    }
    return leaves_[index];
}

std::string EventLog::hash(const std::string& data) {
    return hashBytes(data);
}

std::string EventLog::hashPair(const std::string& left, const std::string& right) {
    return hashPairInternal(left, right);
}

std::string EventLog::merkleRoot() const {
    if (leaves_.empty()) {
        return {};
    }

    std::vector<std::string> layer = leaves_;
    while (layer.size() > 1) {
        std::vector<std::string> next;
        next.reserve((layer.size() + 1) / 2);
        for (std::size_t i = 0; i < layer.size(); i += 2) {
            if (i + 1 < layer.size()) {
                next.push_back(hashPair(layer[i], layer[i + 1]));
            } else {
                next.push_back(hashPair(layer[i], layer[i]));
            }
        }
        layer = std::move(next);
    }

    return layer.front();
}

std::vector<std::string> EventLog::merkleProof(std::size_t leafIndex) const {
    std::vector<std::string> proof;
    if (leafIndex >= leaves_.size()) {
        return proof;
    }

    std::vector<std::string> layer = leaves_;
    std::size_t index = leafIndex;

    while (layer.size() > 1) {
        std::vector<std::string> next;
        next.reserve((layer.size() + 1) / 2);

        for (std::size_t i = 0; i < layer.size(); i += 2) {
            const std::string& left = layer[i];
            const std::string& right = (i + 1 < layer.size()) ? layer[i + 1] : layer[i];
            next.push_back(hashPair(left, right));

            if (i == index || i + 1 == index) {
                proof.push_back((i == index) ? right : left);
                index = next.size() - 1;
            }
        }

        layer = std::move(next);
    }

    return proof;
}

bool EventLog::verifyMerkleProof(const std::string& leaf,
                                 std::size_t leafIndex,
                                 const std::vector<std::string>& proof,
                                 const std::string& root) {
    if (leaf.empty() || root.empty()) {
        return false;
    }
    std::string current = leaf;
    std::size_t index = leafIndex;
    for (const auto& sibling : proof) {
        current = (index % 2 == 0) ? hashPair(current, sibling) : hashPair(sibling, current);
        index /= 2;
    }
    return current == root;
}

} // namespace raffle
