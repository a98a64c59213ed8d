#include "value_transfer.hpp"

#include <limits>
#include <stdexcept>
#include <utility>

namespace raffle {

bool AccountBook::send(const Address& from, const Address& to, const Wei& amount) {
    if (from.empty() || to.empty() || from == to || rejecting_.count(to) != 0) {
        return false;
    }
    if (balanceOf(from) < amount) {
        return false;
    }

    move(from, to, amount);

    auto hookIt = hooks_.find(to);
    if (hookIt != hooks_.end()) {
        // Copy: the hook may replace itself while running.
        ReceiveHook hook = hookIt->second;
        bool accepted = false;
        try {
            accepted = hook(to, amount);
        } catch (const std::exception&) {
            move(to, from, amount);
            throw;
        }
        if (!accepted) {
            move(to, from, amount);
            return false;
        }
    }

    ++transferCount_;
    return true;
}

void AccountBook::credit(const Address& account, const Wei& amount) {
    if (account.empty()) {
        throw std::invalid_argument("cannot credit the empty address");
    }
    if (totalSupply() > std::numeric_limits<Wei>::max() - amount) {
        throw std::overflow_error("crediting " + account + " would overflow the total supply");
    }
    balances_[account] += amount;
}

Wei AccountBook::balanceOf(const Address& account) const {
    auto it = balances_.find(account);
    if (it == balances_.end()) {
        return 0;
    }
    return it->second;
}

Wei AccountBook::totalSupply() const {
    Wei total = 0;
    for (const auto& entry : balances_) {
        total += entry.second;
    }
    return total;
}

void AccountBook::rejectPayments(const Address& account, bool reject) {
    if (reject) {
        rejecting_.insert(account);
    } else {
        rejecting_.erase(account);
    }
}

void AccountBook::setReceiveHook(const Address& account, ReceiveHook hook) {
    hooks_[account] = std::move(hook);
}

void AccountBook::clearReceiveHook(const Address& account) {
    hooks_.erase(account);
}

// Total supply bounds every balance, so only the debit side can fail.
void AccountBook::move(const Address& from, const Address& to, const Wei& amount) {
    auto it = balances_.find(from);
    if (it == balances_.end() || it->second < amount) {
        throw std::logic_error(from + " no longer holds the funds being moved");
    }
    it->second -= amount;
    balances_[to] += amount;
}

} // namespace raffle
