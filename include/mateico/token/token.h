// MATEICO - Fungible Token Ledger
// Copyright (c) 2024 MATEICO Developers
// MIT License
//
// Defines the token collaborator consumed by the staking and vesting
// ledgers, plus an in-memory implementation used by the command-line
// tool and the tests.

#ifndef MATEICO_TOKEN_TOKEN_H
#define MATEICO_TOKEN_TOKEN_H

#include "mateico/core/types.h"

#include <map>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace mateico {
namespace token {

// ============================================================================
// Token Interface
// ============================================================================

/**
 * Fungible token ledger as seen by the staking and vesting ledgers.
 *
 * Every mutating call is atomic: it either applies completely and
 * returns true, or leaves all balances and allowances untouched and
 * returns false.
 */
class ITokenLedger {
public:
    virtual ~ITokenLedger() = default;

    virtual std::string GetName() const = 0;
    virtual std::string GetSymbol() const = 0;
    virtual int GetDecimals() const = 0;
    virtual Amount TotalSupply() const = 0;

    virtual Amount BalanceOf(const Address& account) const = 0;
    virtual Amount Allowance(const Address& owner, const Address& spender) const = 0;

    /// Move `amount` from `from` to `to`
    virtual bool Transfer(const Address& from, const Address& to, Amount amount) = 0;

    /// Move `amount` from `from` to `to` on behalf of `spender`,
    /// consuming the allowance `from` granted to `spender`
    virtual bool TransferFrom(const Address& spender, const Address& from,
                              const Address& to, Amount amount) = 0;

    /// Set the allowance `owner` grants to `spender`
    virtual bool Approve(const Address& owner, const Address& spender, Amount amount) = 0;
};

// ============================================================================
// In-Memory Token Ledger
// ============================================================================

/**
 * Balance and allowance maps with a fixed supply minted to a creator.
 * An allowance of MAX_AMOUNT is treated as unlimited and is never
 * decremented.
 */
class MemoryTokenLedger : public ITokenLedger {
public:
    static constexpr int DECIMALS = COIN_DECIMALS;

    MemoryTokenLedger(std::string name, std::string symbol,
                      const Address& creator, Amount initialSupply);

    std::string GetName() const override;
    std::string GetSymbol() const override;
    int GetDecimals() const override { return DECIMALS; }
    Amount TotalSupply() const override;

    Amount BalanceOf(const Address& account) const override;
    Amount Allowance(const Address& owner, const Address& spender) const override;

    bool Transfer(const Address& from, const Address& to, Amount amount) override;
    bool TransferFrom(const Address& spender, const Address& from,
                      const Address& to, Amount amount) override;
    bool Approve(const Address& owner, const Address& spender, Amount amount) override;

    /// Number of accounts holding a non-zero balance
    size_t HolderCount() const;

    /// Serialize full state (name, symbol, supply, balances, allowances)
    std::vector<Byte> Serialize() const;

    /// Replace state from serialized bytes; false on malformed input
    bool Deserialize(const Byte* data, size_t len);

private:
    /// Caller must hold mutex_
    bool MoveBalance(const Address& from, const Address& to, Amount amount);

    std::string name_;
    std::string symbol_;
    Amount totalSupply_{0};
    std::map<Address, Amount> balances_;
    std::map<std::pair<Address, Address>, Amount> allowances_;
    mutable std::mutex mutex_;
};

} // namespace token
} // namespace mateico

#endif // MATEICO_TOKEN_TOKEN_H
