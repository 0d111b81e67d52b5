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
#include <harvest/core/config.hpp>
#include <harvest/core/int.hpp>

#include <cstdint>

HARVEST_NAMESPACE_BEGIN

// fixed point scale of reward per share
inline constexpr uint256_t PRECISION{1'000'000'000'000};

inline constexpr auto DEFAULT_FARM_ADDRESS =
    0x0000000000000000000000000000000000001000_address;
inline constexpr auto DEFAULT_REWARD_TOKEN_ADDRESS =
    0x0000000000000000000000000000000000001001_address;

// operator fee divisor per epoch, the last entry applies afterwards
inline constexpr uint64_t DEFAULT_DEV_FEE_DIVISORS[] = {10, 10, 20};

HARVEST_NAMESPACE_END
