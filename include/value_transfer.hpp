#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <set>

#include "raffle_types.hpp"

namespace raffle {

// Moves value between accounts. Returns false, with nothing moved, when the
// payer cannot cover the amount or the recipient refuses it.
class ValueTransfer {
public:
    virtual ~ValueTransfer() = default;
    virtual bool send(const Address& from, const Address& to, const Wei& amount) = 0;
};

// In-memory balances. A receive hook runs after the funds land, the way a
// contract fallback does, and may call back into whoever is paying; returning
// false or throwing undoes the transfer.
class AccountBook : public ValueTransfer {
public:
    using ReceiveHook = std::function<bool(const Address& to, const Wei& amount)>;

    bool send(const Address& from, const Address& to, const Wei& amount) override;

    // Mints funds into an account; the local stand-in for a faucet.
    void credit(const Address& account, const Wei& amount);
    Wei balanceOf(const Address& account) const;
    Wei totalSupply() const;

    void rejectPayments(const Address& account, bool reject = true);
    void setReceiveHook(const Address& account, ReceiveHook hook);
    void clearReceiveHook(const Address& account);

    std::uint64_t getTransferCount() const { return transferCount_; }

private:
    void move(const Address& from, const Address& to, const Wei& amount);

    std::map<Address, Wei> balances_;
    std::set<Address> rejecting_;
    std::map<Address, ReceiveHook> hooks_;
    std::uint64_t transferCount_ = 0;
};

} // namespace raffle
