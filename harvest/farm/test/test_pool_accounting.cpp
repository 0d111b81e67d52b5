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

#include <harvest/core/address.hpp>
#include <harvest/core/int.hpp>
#include <harvest/farm/constants.hpp>
#include <harvest/farm/farm_error.hpp>
#include <harvest/farm/farm_params.hpp>
#include <harvest/farm/farm_variables.hpp>
#include <harvest/farm/pool_accounting.hpp>
#include <harvest/farm/reward_schedule.hpp>
#include <harvest/state/state.hpp>
#include <harvest/token/ledger_token.hpp>
#include <harvest/token/token_registry.hpp>

#include "farm_fixture.hpp"

#include <gtest/gtest.h>
#include <intx/intx.hpp>

#include <cstdint>

using namespace harvest;
using namespace harvest::test;

struct Accounting : public ::testing::Test
{
    State state{};
    LedgerToken reward{state, REWARD, "RWD"};
    LedgerToken lp{state, LP, "LP"};
    TokenRegistry tokens{};
    FarmParams params{make_params()};
    RewardSchedule schedule{params};
    FarmVariables vars{state, FARM};
    PoolAccounting accounting{vars, FARM, schedule, tokens, reward};

    void SetUp() override
    {
        ASSERT_TRUE(tokens.add(reward));
        ASSERT_TRUE(tokens.add(lp));
        reward.set_minter(FARM);
        lp.set_minter(LP_MINTER);
        vars.dev_address.store(DEV);
    }

    // registers a pool directly in storage
    uint64_t add_pool(uint64_t weight, uint64_t tick)
    {
        uint64_t const id = vars.pool_assets.length();
        vars.pool_assets.push(LP);
        auto pool = vars.pool(id);
        pool.alloc_weight().store(uint256_t{weight});
        pool.last_refresh_tick().store(tick);
        vars.total_weight.store(vars.total_weight.load().native() + weight);
        return id;
    }

    void stake(uint64_t amount)
    {
        ASSERT_FALSE(lp.mint(LP_MINTER, FARM, amount).has_error());
    }
};

TEST_F(Accounting, zero_staked_balance)
{
    auto const pool = add_pool(1, 0);

    ASSERT_FALSE(accounting.refresh(pool, 100).has_error());
    EXPECT_EQ(vars.pool(pool).last_refresh_tick().load().native(), 100);
    EXPECT_EQ(vars.pool(pool).acc_reward_per_share().load().native(), 0);
    EXPECT_EQ(reward.total_supply(), 0);
}

TEST_F(Accounting, simulate_has_no_effect)
{
    auto const pool = add_pool(1, 0);
    stake(100);

    auto const accrual = accounting.simulate(pool, 100);
    ASSERT_FALSE(accrual.has_error());
    EXPECT_EQ(accrual.value().pool_reward, 8000);
    EXPECT_EQ(accrual.value().dev_reward, 800);
    EXPECT_EQ(accrual.value().acc_reward_per_share, PRECISION * 80);
    EXPECT_EQ(accrual.value().last_refresh_tick, 100);

    EXPECT_EQ(vars.pool(pool).last_refresh_tick().load().native(), 0);
    EXPECT_EQ(reward.total_supply(), 0);
}

TEST_F(Accounting, refresh_matches_simulate)
{
    auto const pool = add_pool(1, 0);
    stake(100);

    auto const accrual = accounting.simulate(pool, 100).value();
    ASSERT_FALSE(accounting.refresh(pool, 100).has_error());

    EXPECT_EQ(
        vars.pool(pool).acc_reward_per_share().load().native(),
        accrual.acc_reward_per_share);
    EXPECT_EQ(reward.balance_of(FARM), accrual.pool_reward);
    EXPECT_EQ(reward.balance_of(DEV), accrual.dev_reward);
}

TEST_F(Accounting, refresh_is_idempotent)
{
    auto const pool = add_pool(1, 0);
    stake(100);

    ASSERT_FALSE(accounting.refresh(pool, 100).has_error());
    ASSERT_FALSE(accounting.refresh(pool, 100).has_error());
    ASSERT_FALSE(accounting.refresh(pool, 60).has_error());

    EXPECT_EQ(reward.balance_of(FARM), 8000);
    EXPECT_EQ(vars.pool(pool).last_refresh_tick().load().native(), 100);
}

TEST_F(Accounting, dev_fee_follows_epoch_of_refresh)
{
    auto const pool = add_pool(1, 200);
    stake(100);

    ASSERT_FALSE(accounting.refresh(pool, 250).has_error());
    EXPECT_EQ(reward.balance_of(FARM), 1000);
    EXPECT_EQ(reward.balance_of(DEV), 50);
}

TEST_F(Accounting, floor_rounding)
{
    auto const pool = add_pool(1, 0);
    stake(3);

    ASSERT_FALSE(accounting.refresh(pool, 1).has_error());
    // 80 * 1e12 / 3
    EXPECT_EQ(
        vars.pool(pool).acc_reward_per_share().load().native(),
        uint256_t{26'666'666'666'666});
}

TEST_F(Accounting, weight_share)
{
    auto const p0 = add_pool(1, 0);
    add_pool(2, 0);
    stake(100);

    ASSERT_FALSE(accounting.refresh(p0, 3).has_error());
    // 240 * 1 / 3
    EXPECT_EQ(reward.balance_of(FARM), 80);
}

TEST_F(Accounting, refresh_all)
{
    auto const p0 = add_pool(1, 0);
    auto const p1 = add_pool(1, 0);
    stake(100);

    ASSERT_FALSE(accounting.refresh_all(100).has_error());
    EXPECT_EQ(vars.pool(p0).last_refresh_tick().load().native(), 100);
    EXPECT_EQ(vars.pool(p1).last_refresh_tick().load().native(), 100);
    EXPECT_EQ(reward.balance_of(FARM), 8000);
}

TEST_F(Accounting, mint_failure)
{
    auto const pool = add_pool(1, 0);
    stake(100);
    reward.set_minter(DEV);

    auto const res = accounting.refresh(pool, 100);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), FarmError::TransferFailed);
}

TEST_F(Accounting, unknown_pool)
{
    auto const res = accounting.simulate(0, 100);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), FarmError::UnknownPool);
}

TEST(AccountingFees, zero_divisor_disables_fee)
{
    auto params = make_params();
    params.dev_fee_divisors = {0};

    State state{};
    LedgerToken reward{state, REWARD, "RWD"};
    LedgerToken lp{state, LP, "LP"};
    TokenRegistry tokens{};
    ASSERT_TRUE(tokens.add(lp));
    reward.set_minter(FARM);
    lp.set_minter(LP_MINTER);
    ASSERT_FALSE(lp.mint(LP_MINTER, FARM, 10).has_error());

    RewardSchedule const schedule{params};
    FarmVariables vars{state, FARM};
    vars.dev_address.store(DEV);
    vars.total_weight.store(uint256_t{1});
    vars.pool_assets.push(LP);
    vars.pool(0).alloc_weight().store(uint256_t{1});

    PoolAccounting accounting{vars, FARM, schedule, tokens, reward};
    ASSERT_FALSE(accounting.refresh(0, 100).has_error());
    EXPECT_EQ(reward.balance_of(FARM), 8000);
    EXPECT_EQ(reward.total_supply(), 8000);
}
