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

#include <cstdint>

HARVEST_NAMESPACE_BEGIN

class RewardSchedule;

// Total emission over [from, to) as a left Riemann sum of the schedule. A
// tick sitting on an epoch boundary belongs to the new epoch.
class PeriodRewardAccumulator
{
    RewardSchedule const &schedule_;

public:
    explicit PeriodRewardAccumulator(RewardSchedule const &);

    Result<uint256_t> integrate(uint64_t from, uint64_t to) const;

    // number of epoch boundaries in (from, to]
    Result<uint64_t> boundaries_crossed(uint64_t from, uint64_t to) const;
};

HARVEST_NAMESPACE_END
