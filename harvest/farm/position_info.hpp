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

HARVEST_NAMESPACE_BEGIN

class State;

struct Position
{
    uint256_t amount{0};
    uint256_t reward_debt{0};
};

// Storage view of one (pool, participant) position.
class PositionInfo
{
    State &state_;
    Address const &address_;
    uint256_t const key_;

public:
    PositionInfo(State &state, Address const &address, bytes32_t const key);

    StorageVariable<u256_be> amount() noexcept;
    StorageVariable<u256_be> const amount() const noexcept;

    // amount * acc_reward_per_share / PRECISION at the last settlement
    StorageVariable<u256_be> reward_debt() noexcept;
    StorageVariable<u256_be> const reward_debt() const noexcept;

    Position load() const noexcept;
};

HARVEST_NAMESPACE_END
