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

#include <harvest/farm/pool_info.hpp>
#include <harvest/state/state.hpp>

#include <intx/intx.hpp>

HARVEST_NAMESPACE_BEGIN

PoolInfo::PoolInfo(State &state, Address const &address, bytes32_t const key)
    : state_{state}
    , address_{address}
    , key_{intx::be::load<uint256_t>(key)}
{
}

StorageVariable<u256_be> PoolInfo::alloc_weight() noexcept
{
    return StorageVariable<u256_be>(state_, address_, key_);
}

StorageVariable<u256_be> const PoolInfo::alloc_weight() const noexcept
{
    return StorageVariable<u256_be>(state_, address_, key_);
}

StorageVariable<u64_be> PoolInfo::last_refresh_tick() noexcept
{
    return StorageVariable<u64_be>(state_, address_, key_ + 1);
}

StorageVariable<u64_be> const PoolInfo::last_refresh_tick() const noexcept
{
    return StorageVariable<u64_be>(state_, address_, key_ + 1);
}

StorageVariable<u256_be> PoolInfo::acc_reward_per_share() noexcept
{
    return StorageVariable<u256_be>(state_, address_, key_ + 2);
}

StorageVariable<u256_be> const PoolInfo::acc_reward_per_share() const noexcept
{
    return StorageVariable<u256_be>(state_, address_, key_ + 2);
}

HARVEST_NAMESPACE_END
