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

#include <harvest/core/config.hpp>
#include <harvest/core/int.hpp>
#include <harvest/core/result.hpp>

#include <cstddef>
#include <cstdint>
#include <vector>

HARVEST_NAMESPACE_BEGIN

struct FarmParams;

// Step function from tick to per tick emission. Epoch e covers
// [genesis + e * epoch_length, genesis + (e + 1) * epoch_length); the last
// rate of the table applies to every later epoch.
class RewardSchedule
{
    uint64_t genesis_tick_;
    uint64_t epoch_length_;
    std::vector<uint256_t> rates_;
    std::vector<uint64_t> dev_fee_divisors_;

public:
    // params must pass validate()
    explicit RewardSchedule(FarmParams const &);

    uint64_t genesis_tick() const noexcept;
    uint64_t epoch_length() const noexcept;

    // index of the epoch from which the rate stays constant
    uint64_t final_epoch() const noexcept;

    Result<uint64_t> epoch_at(uint64_t tick) const;

    // saturates at the largest tick
    uint64_t epoch_start(uint64_t epoch) const noexcept;

    uint256_t rate_for_epoch(uint64_t epoch) const noexcept;

    Result<uint256_t> rate_at(uint64_t tick) const;

    uint64_t dev_fee_divisor(uint64_t epoch) const noexcept;
};

HARVEST_NAMESPACE_END
