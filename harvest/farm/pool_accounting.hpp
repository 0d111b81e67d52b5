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
#include <harvest/core/result.hpp>
#include <harvest/farm/period_reward_accumulator.hpp>

#include <cstdint>

HARVEST_NAMESPACE_BEGIN

class FarmVariables;
class MintableToken;
class RewardSchedule;
class TokenRegistry;

// Effect of bringing a pool up to date at some tick.
struct Accrual
{
    // minted to the farm's custody
    uint256_t pool_reward{0};
    // minted to the dev address
    uint256_t dev_reward{0};
    uint256_t acc_reward_per_share{0};
    uint64_t last_refresh_tick{0};
};

// Lazy per pool accumulator. Elapsed ticks are converted into reward per
// share only when a pool is touched.
class PoolAccounting
{
    FarmVariables &vars_;
    Address const &farm_;
    RewardSchedule const &schedule_;
    PeriodRewardAccumulator const accumulator_;
    TokenRegistry const &tokens_;
    MintableToken &reward_token_;

    Result<void> mint_reward(Address const &recipient, uint256_t const &);

public:
    PoolAccounting(
        FarmVariables &, Address const &farm, RewardSchedule const &,
        TokenRegistry const &, MintableToken &reward_token);

    // what refresh(pool, now) would do, without writing anything
    Result<Accrual> simulate(uint64_t pool, uint64_t now) const;

    // idempotent for a given tick
    Result<void> refresh(uint64_t pool, uint64_t now);

    // refresh every pool in id order
    Result<void> refresh_all(uint64_t now);
};

HARVEST_NAMESPACE_END
