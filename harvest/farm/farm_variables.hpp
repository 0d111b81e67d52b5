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
#include <harvest/contract/big_endian.hpp>
#include <harvest/contract/storage_array.hpp>
#include <harvest/contract/storage_variable.hpp>
#include <harvest/farm/pool_info.hpp>
#include <harvest/farm/position_info.hpp>

#include <bit>
#include <cstdint>

HARVEST_NAMESPACE_BEGIN

class State;

// Storage layout of a farm.
class FarmVariables
{
    State &state_;
    Address const &ca_;

    // Single slot constants all under prefix 0x0
    static constexpr auto AddressOwner{
        0x0000000000000000000000000000000000000000000000000000000000000001_bytes32};
    static constexpr auto AddressDev{
        0x0000000000000000000000000000000000000000000000000000000000000002_bytes32};
    static constexpr auto AddressTotalWeight{
        0x0000000000000000000000000000000000000000000000000000000000000003_bytes32};
    static constexpr auto AddressLatestTick{
        0x0000000000000000000000000000000000000000000000000000000000000004_bytes32};

    // Ordered pool list gets prefix 0x1
    static constexpr auto AddressPoolAssets{
        0x0100000000000000000000000000000000000000000000000000000000000000_bytes32};

    // Prefixes for mappings
    enum : uint8_t
    {
        PrefixPool = 0x0A,
        PrefixPosition = 0x0B,
        PrefixAssetPool = 0x0C,
    };

public:
    explicit FarmVariables(State &state, Address const &ca)
        : state_{state}
        , ca_{ca}
    {
    }

    StorageVariable<Address> owner{state_, ca_, AddressOwner};
    StorageVariable<Address> dev_address{state_, ca_, AddressDev};
    StorageVariable<u256_be> total_weight{state_, ca_, AddressTotalWeight};
    StorageVariable<u64_be> latest_tick{state_, ca_, AddressLatestTick};

    // staked asset of every pool, indexed by pool id
    StorageArray<Address> pool_assets{state_, ca_, AddressPoolAssets};

    ////////////////
    //  Mappings  //
    ////////////////

    // mapping(uint64 => Pool) pool_info
    auto pool(u64_be const id) const noexcept
    {
        struct
        {
            uint8_t mask;
            u64_be pool_id;
            uint8_t slots[23];
        } key{.mask = PrefixPool, .pool_id = id, .slots = {}};

        return PoolInfo{state_, ca_, std::bit_cast<bytes32_t>(key)};
    }

    // mapping(uint64 => mapping(address => Position)) position
    auto position(
        u64_be const pool_id, Address const &participant) const noexcept
    {
        struct
        {
            uint8_t mask;
            u64_be pool_id;
            Address address;
            uint8_t slots[3];
        } key{
            .mask = PrefixPosition,
            .pool_id = pool_id,
            .address = participant,
            .slots = {}};

        return PositionInfo{state_, ca_, std::bit_cast<bytes32_t>(key)};
    }

    // mapping(address => uint64) pool id + 1 of the pool staking the asset
    auto asset_pool(Address const &asset) const noexcept
    {
        struct
        {
            uint8_t mask;
            Address address;
            uint8_t slots[11];
        } key{.mask = PrefixAssetPool, .address = asset, .slots = {}};

        return StorageVariable<u64_be>(
            state_, ca_, std::bit_cast<bytes32_t>(key));
    }
};

HARVEST_NAMESPACE_END
