// MATEICO - Staking Positions Implementation
// Copyright (c) 2024 MATEICO Developers
// MIT License

#include "mateico/ledger/position.h"

namespace mateico {
namespace ledger {

// ============================================================================
// Position Book
// ============================================================================

void PositionBook::Append(const Address& owner, const Position& position) {
    positions_[owner].push_back(position);
}

std::vector<Position> PositionBook::GetPositions(const Address& owner) const {
    auto it = positions_.find(owner);
    if (it == positions_.end()) {
        return {};
    }
    return it->second;
}

size_t PositionBook::Count(const Address& owner) const {
    auto it = positions_.find(owner);
    return it == positions_.end() ? 0 : it->second.size();
}

Amount PositionBook::TotalOf(const Address& owner) const {
    Amount sum = 0;
    auto it = positions_.find(owner);
    if (it != positions_.end()) {
        for (const auto& pos : it->second) {
            sum += pos.totalAmount;
        }
    }
    return sum;
}

Amount PositionBook::Claimable(const Address& owner, Timestamp now) const {
    Amount sum = 0;
    auto it = positions_.find(owner);
    if (it != positions_.end()) {
        for (const auto& pos : it->second) {
            if (pos.IsMatured(now)) {
                sum += pos.totalAmount;
            }
        }
    }
    return sum;
}

Amount PositionBook::TakeMatured(const Address& owner, Timestamp now) {
    auto it = positions_.find(owner);
    if (it == positions_.end()) {
        return 0;
    }

    auto& list = it->second;
    Amount sum = 0;
    size_t i = 0;
    while (i < list.size()) {
        if (list[i].IsMatured(now)) {
            sum += list[i].totalAmount;
            list[i] = list.back();
            list.pop_back();
        } else {
            ++i;
        }
    }

    if (list.empty()) {
        positions_.erase(it);
    }
    return sum;
}

const Position& PositionBook::At(const Address& owner, size_t index) const {
    return positions_.at(owner).at(index);
}

void PositionBook::RemoveAt(const Address& owner, size_t index) {
    auto& list = positions_.at(owner);
    list.at(index) = list.back();
    list.pop_back();
    if (list.empty()) {
        positions_.erase(owner);
    }
}

void PositionBook::Restore(const Address& owner, std::vector<Position> positions) {
    if (positions.empty()) {
        positions_.erase(owner);
    } else {
        positions_[owner] = std::move(positions);
    }
}

void PositionBook::Serialize(DataStream& s) const {
    WriteCompactSize(s, positions_.size());
    for (const auto& [owner, list] : positions_) {
        s << owner;
        WriteCompactSize(s, list.size());
        for (const auto& pos : list) {
            s << pos.unlockTime << pos.totalAmount;
        }
    }
}

void PositionBook::Unserialize(DataStream& s) {
    std::map<Address, std::vector<Position>> positions;
    uint64_t owners = ReadCompactSize(s);
    for (uint64_t i = 0; i < owners; ++i) {
        Address owner;
        s >> owner;
        uint64_t count = ReadCompactSize(s);
        std::vector<Position> list;
        for (uint64_t j = 0; j < count; ++j) {
            Position pos;
            s >> pos.unlockTime >> pos.totalAmount;
            list.push_back(pos);
        }
        if (!list.empty()) {
            positions[owner] = std::move(list);
        }
    }
    positions_ = std::move(positions);
}

// ============================================================================
// Pool Keyed Balance
// ============================================================================

Amount PoolKeyedBalance::Get(const PoolHash& pool, const Address& owner) const {
    auto it = balances_.find({pool, owner});
    return it == balances_.end() ? 0 : it->second;
}

void PoolKeyedBalance::Add(const PoolHash& pool, const Address& owner, Amount amount) {
    balances_[{pool, owner}] += amount;
}

void PoolKeyedBalance::Set(const PoolHash& pool, const Address& owner, Amount amount) {
    if (amount == 0) {
        balances_.erase({pool, owner});
    } else {
        balances_[{pool, owner}] = amount;
    }
}

void PoolKeyedBalance::Serialize(DataStream& s) const {
    WriteCompactSize(s, balances_.size());
    for (const auto& [key, amount] : balances_) {
        s << key.first << key.second << amount;
    }
}

void PoolKeyedBalance::Unserialize(DataStream& s) {
    std::map<std::pair<PoolHash, Address>, Amount> balances;
    uint64_t count = ReadCompactSize(s);
    for (uint64_t i = 0; i < count; ++i) {
        PoolHash pool;
        Address owner;
        Amount amount = 0;
        s >> pool >> owner >> amount;
        balances[{pool, owner}] = amount;
    }
    balances_ = std::move(balances);
}

} // namespace ledger
} // namespace mateico
