// MATEICO - Fungible Token Ledger Implementation
// Copyright (c) 2024 MATEICO Developers
// MIT License

#include "mateico/token/token.h"
#include "mateico/core/amount.h"
#include "mateico/core/serialize.h"
#include "mateico/util/logging.h"

namespace mateico {
namespace token {

MemoryTokenLedger::MemoryTokenLedger(std::string name, std::string symbol,
                                     const Address& creator, Amount initialSupply)
    : name_(std::move(name))
    , symbol_(std::move(symbol))
    , totalSupply_(initialSupply) {
    if (initialSupply > 0) {
        balances_[creator] = initialSupply;
    }
}

std::string MemoryTokenLedger::GetName() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return name_;
}

std::string MemoryTokenLedger::GetSymbol() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return symbol_;
}

Amount MemoryTokenLedger::TotalSupply() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return totalSupply_;
}

Amount MemoryTokenLedger::BalanceOf(const Address& account) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = balances_.find(account);
    return it != balances_.end() ? it->second : 0;
}

Amount MemoryTokenLedger::Allowance(const Address& owner, const Address& spender) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = allowances_.find({owner, spender});
    return it != allowances_.end() ? it->second : 0;
}

bool MemoryTokenLedger::MoveBalance(const Address& from, const Address& to, Amount amount) {
    if (to.IsNull()) {
        LOG_DEBUG(util::LogCategory::TOKEN) << "Transfer rejected: null recipient";
        return false;
    }

    auto fromIt = balances_.find(from);
    Amount fromBalance = fromIt != balances_.end() ? fromIt->second : 0;
    if (fromBalance < amount) {
        LOG_DEBUG(util::LogCategory::TOKEN) << "Transfer rejected: balance "
                                            << FormatAmount(fromBalance) << " below "
                                            << FormatAmount(amount);
        return false;
    }
    if (amount == 0 || from == to) {
        return true;
    }

    if (fromBalance == amount) {
        balances_.erase(fromIt);
    } else {
        fromIt->second = fromBalance - amount;
    }
    balances_[to] += amount;
    return true;
}

bool MemoryTokenLedger::Transfer(const Address& from, const Address& to, Amount amount) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!MoveBalance(from, to, amount)) {
        return false;
    }
    LOG_TRACE(util::LogCategory::TOKEN) << "Transfer " << FormatAmount(amount) << " "
                                        << symbol_ << " " << from.ToHex().substr(0, 8)
                                        << " -> " << to.ToHex().substr(0, 8);
    return true;
}

bool MemoryTokenLedger::TransferFrom(const Address& spender, const Address& from,
                                     const Address& to, Amount amount) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto allowIt = allowances_.find({from, spender});
    Amount allowance = allowIt != allowances_.end() ? allowIt->second : 0;
    if (allowance < amount) {
        LOG_DEBUG(util::LogCategory::TOKEN) << "TransferFrom rejected: allowance "
                                            << FormatAmount(allowance) << " below "
                                            << FormatAmount(amount);
        return false;
    }

    if (!MoveBalance(from, to, amount)) {
        return false;
    }

    if (allowance != MAX_AMOUNT && amount > 0) {
        if (allowance == amount) {
            allowances_.erase(allowIt);
        } else {
            allowIt->second = allowance - amount;
        }
    }

    LOG_TRACE(util::LogCategory::TOKEN) << "TransferFrom " << FormatAmount(amount) << " "
                                        << symbol_ << " by " << spender.ToHex().substr(0, 8);
    return true;
}

bool MemoryTokenLedger::Approve(const Address& owner, const Address& spender, Amount amount) {
    if (spender.IsNull()) {
        return false;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    if (amount == 0) {
        allowances_.erase({owner, spender});
    } else {
        allowances_[{owner, spender}] = amount;
    }
    return true;
}

size_t MemoryTokenLedger::HolderCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return balances_.size();
}

// ============================================================================
// Serialization
// ============================================================================

std::vector<Byte> MemoryTokenLedger::Serialize() const {
    std::lock_guard<std::mutex> lock(mutex_);
    DataStream ss;

    ss << name_ << symbol_ << totalSupply_;

    WriteCompactSize(ss, balances_.size());
    for (const auto& [account, balance] : balances_) {
        ss << account << balance;
    }

    WriteCompactSize(ss, allowances_.size());
    for (const auto& [key, allowance] : allowances_) {
        ss << key.first << key.second << allowance;
    }

    return std::vector<Byte>(ss.begin(), ss.end());
}

bool MemoryTokenLedger::Deserialize(const Byte* data, size_t len) {
    if (!data || len == 0) {
        return false;
    }

    try {
        DataStream ss(data, len);

        std::string name;
        std::string symbol;
        Amount supply = 0;
        ss >> name >> symbol >> supply;

        std::map<Address, Amount> balances;
        uint64_t count = ReadCompactSize(ss);
        for (uint64_t i = 0; i < count; ++i) {
            Address account;
            Amount balance = 0;
            ss >> account >> balance;
            balances[account] = balance;
        }

        std::map<std::pair<Address, Address>, Amount> allowances;
        count = ReadCompactSize(ss);
        for (uint64_t i = 0; i < count; ++i) {
            Address owner;
            Address spender;
            Amount allowance = 0;
            ss >> owner >> spender >> allowance;
            allowances[{owner, spender}] = allowance;
        }

        if (!ss.empty()) {
            return false;
        }

        std::lock_guard<std::mutex> lock(mutex_);
        name_ = std::move(name);
        symbol_ = std::move(symbol);
        totalSupply_ = supply;
        balances_ = std::move(balances);
        allowances_ = std::move(allowances);
        return true;
    } catch (const std::ios_base::failure& e) {
        LOG_ERROR(util::LogCategory::TOKEN) << "Token state decode failed: " << e.what();
        return false;
    }
}

} // namespace token
} // namespace mateico
