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

#include <harvest/core/fmt/int_fmt.hpp>
#include <harvest/core/likely.h>
#include <harvest/farm/farm_error.hpp>
#include <harvest/farm/period_reward_accumulator.hpp>
#include <harvest/farm/reward_schedule.hpp>

#include <intx/intx.hpp>
#include <quill/Quill.h>

#include <algorithm>

HARVEST_NAMESPACE_BEGIN

PeriodRewardAccumulator::PeriodRewardAccumulator(
    RewardSchedule const &schedule)
    : schedule_{schedule}
{
}

Result<uint64_t> PeriodRewardAccumulator::boundaries_crossed(
    uint64_t const from, uint64_t const to) const
{
    if (HARVEST_UNLIKELY(to < from)) {
        return FarmError::InvalidInterval;
    }
    BOOST_OUTCOME_TRY(auto const first, schedule_.epoch_at(from));
    BOOST_OUTCOME_TRY(auto const last, schedule_.epoch_at(to));
    return last - first;
}

Result<uint256_t> PeriodRewardAccumulator::integrate(
    uint64_t const from, uint64_t const to) const
{
    BOOST_OUTCOME_TRY(auto const crossed, boundaries_crossed(from, to));
    if (HARVEST_UNLIKELY(crossed > 1)) {
        LOG_WARNING(
            "Harvest: integrating [{}, {}) across {} epoch boundaries",
            from,
            to,
            crossed);
    }

    BOOST_OUTCOME_TRY(auto epoch, schedule_.epoch_at(from));
    uint256_t total = 0;
    uint64_t cursor = from;
    while (cursor < to) {
        uint64_t const segment_end =
            epoch >= schedule_.final_epoch()
                ? to
                : std::min(to, schedule_.epoch_start(epoch + 1));
        total += uint256_t{segment_end - cursor} *
                 schedule_.rate_for_epoch(epoch);
        cursor = segment_end;
        ++epoch;
    }
    return total;
}

HARVEST_NAMESPACE_END
