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

#include <harvest/core/assert.h>
#include <harvest/core/likely.h>
#include <harvest/farm/farm_error.hpp>
#include <harvest/farm/farm_params.hpp>
#include <harvest/farm/reward_schedule.hpp>

#include <intx/intx.hpp>

#include <algorithm>
#include <limits>

HARVEST_NAMESPACE_BEGIN

RewardSchedule::RewardSchedule(FarmParams const &params)
    : genesis_tick_{params.genesis_tick}
    , epoch_length_{params.epoch_length}
    , rates_{params.rates}
    , dev_fee_divisors_{params.dev_fee_divisors}
{
    HARVEST_ASSERT(epoch_length_ > 0);
    HARVEST_ASSERT(!rates_.empty());
}

uint64_t RewardSchedule::genesis_tick() const noexcept
{
    return genesis_tick_;
}

uint64_t RewardSchedule::epoch_length() const noexcept
{
    return epoch_length_;
}

uint64_t RewardSchedule::final_epoch() const noexcept
{
    return rates_.size() - 1;
}

Result<uint64_t> RewardSchedule::epoch_at(uint64_t const tick) const
{
    if (HARVEST_UNLIKELY(tick < genesis_tick_)) {
        return FarmError::OutOfRange;
    }
    return (tick - genesis_tick_) / epoch_length_;
}

uint64_t RewardSchedule::epoch_start(uint64_t const epoch) const noexcept
{
    uint128_t const start =
        uint128_t{genesis_tick_} + uint128_t{epoch} * epoch_length_;
    if (start > std::numeric_limits<uint64_t>::max()) {
        return std::numeric_limits<uint64_t>::max();
    }
    return static_cast<uint64_t>(start);
}

uint256_t RewardSchedule::rate_for_epoch(uint64_t const epoch) const noexcept
{
    return rates_[std::min(epoch, final_epoch())];
}

Result<uint256_t> RewardSchedule::rate_at(uint64_t const tick) const
{
    BOOST_OUTCOME_TRY(auto const epoch, epoch_at(tick));
    return rate_for_epoch(epoch);
}

uint64_t RewardSchedule::dev_fee_divisor(uint64_t const epoch) const noexcept
{
    if (dev_fee_divisors_.empty()) {
        return 0;
    }
    return dev_fee_divisors_[std::min<uint64_t>(
        epoch, dev_fee_divisors_.size() - 1)];
}

HARVEST_NAMESPACE_END
