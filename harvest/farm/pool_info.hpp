// Copyright (C) 2025 Category Labs, Inc.
//
// This program is free software: you can redistribute it and/or modify
// it under the terms of the GNU General Public License as published by
// the Free Software Foundation, either version 3 of the License, or
// (at your option) any later version.
//
// This program is distributed in the hope that it will be useful,
// but WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
// GNU General Public License for more details.
//
// You should have received a copy of the GNU General Public License
// along with this program.  If not, see <http://www.gnu.org/licenses/>.

#pragma once

#include <harvest/core/address.hpp>
#include <harvest/core/bytes.hpp>
#include <harvest/core/config.hpp>
#include <harvest/core/int.hpp>
#include <harvest/contract/big_endian.hpp>
#include <harvest/contract/storage_variable.hpp>

#include <cstdint>

HARVEST_NAMESPACE_BEGIN

class State;

// Plain copy of a pool, as returned by queries.
struct Pool
{
    Address staked_asset{};
    uint256_t alloc_weight{0};
    uint64_t last_refresh_tick{0};
    uint256_t acc_reward_per_share{0};
};

// Storage view of the mutable fields of a pool. The staked asset lives in
// the ordered pool list.
class PoolInfo
{
    State &state_;
    Address const &address_;
    uint256_t const key_;

public:
    PoolInfo(State &state, Address const &address, bytes32_t const key);

    StorageVariable<u256_be> alloc_weight() noexcept;
    StorageVariable<u256_be> const alloc_weight() const noexcept;
    StorageVariable<u64_be> last_refresh_tick() noexcept;
    StorageVariable<u64_be> const last_refresh_tick() const noexcept;
    StorageVariable<u256_be> acc_reward_per_share() noexcept;
    StorageVariable<u256_be> const acc_reward_per_share() const noexcept;
};

HARVEST_NAMESPACE_END
