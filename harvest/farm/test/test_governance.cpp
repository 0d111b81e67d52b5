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

#include <harvest/contract/abi_encode.hpp>
#include <harvest/core/address.hpp>
#include <harvest/core/int.hpp>
#include <harvest/core/result.hpp>
#include <harvest/farm/constants.hpp>
#include <harvest/farm/farm_error.hpp>
#include <harvest/farm/migrator.hpp>
#include <harvest/farm/staking_engine.hpp>
#include <harvest/state/state.hpp>
#include <harvest/token/ledger_token.hpp>
#include <harvest/token/token.hpp>

#include "farm_fixture.hpp"

#include <gtest/gtest.h>
#include <intx/intx.hpp>

using namespace harvest;
using namespace harvest::test;

namespace
{
    constexpr auto MIGRATOR =
        0x000000000000000000000000000000000000face_address;
    constexpr auto LP_V2 = 0x0000000000000000000000000000000000002003_address;
    constexpr auto STRANGER =
        0x0000000000000000000000000000000000005555_address;

    // Pulls the farm's old asset and mints the same amount of the
    // replacement, minus a configurable shortfall.
    class SwapMigrator final : public Migrator
    {
        Address const address_{MIGRATOR};
        LedgerToken &replacement_;
        uint256_t shortfall_;

    public:
        SwapMigrator(LedgerToken &replacement, uint256_t shortfall = 0)
            : replacement_{replacement}
            , shortfall_{shortfall}
        {
        }

        Address const &address() const noexcept override
        {
            return address_;
        }

        Result<Address> migrate(FungibleToken &old_asset) override
        {
            uint256_t const balance = old_asset.balance_of(FARM);
            BOOST_OUTCOME_TRY(
                old_asset.transfer_from(address_, FARM, address_, balance));
            BOOST_OUTCOME_TRY(
                replacement_.mint(address_, FARM, balance - shortfall_));
            return replacement_.address();
        }
    };

    // Hands back the reward token as the replacement asset.
    class RewardMigrator final : public Migrator
    {
        Address const address_{MIGRATOR};

    public:
        Address const &address() const noexcept override
        {
            return address_;
        }

        Result<Address> migrate(FungibleToken &old_asset) override
        {
            uint256_t const balance = old_asset.balance_of(FARM);
            BOOST_OUTCOME_TRY(
                old_asset.transfer_from(address_, FARM, address_, balance));
            return REWARD;
        }
    };
}

struct Governance : public Farm
{
    LedgerToken lp_v2{state, LP_V2, "LPv2"};

    void SetUp() override
    {
        Farm::SetUp();
        lp_v2.set_minter(MIGRATOR);
    }
};

TEST_F(Governance, initial_roles)
{
    EXPECT_EQ(engine.owner(), OWNER);
    EXPECT_EQ(engine.dev_address(), DEV);
    EXPECT_EQ(engine.address(), FARM);
    EXPECT_EQ(engine.pool_length(), 0);
    EXPECT_EQ(engine.total_allocation_weight(), 0);
}

TEST_F(Governance, add_pool_requires_owner)
{
    auto const res = engine.add_pool(ALICE, 1, LP, false, 0);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), FarmError::Unauthorized);
    EXPECT_EQ(engine.pool_length(), 0);
    EXPECT_EQ(engine.total_allocation_weight(), 0);
}

TEST_F(Governance, add_pool_unknown_asset)
{
    auto const res = engine.add_pool(OWNER, 1, STRANGER, false, 0);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), FarmError::UnknownAsset);
}

TEST_F(Governance, add_pool_duplicate_asset)
{
    EXPECT_EQ(add_pool(LP), 0);
    auto const res = engine.add_pool(OWNER, 5, LP, false, 0);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), FarmError::DuplicatePool);
    EXPECT_EQ(engine.pool_length(), 1);
    EXPECT_EQ(engine.total_allocation_weight(), 1);
}

TEST_F(Governance, add_pool_rejects_reward_token)
{
    auto const res = engine.add_pool(OWNER, 1, REWARD, false, 0);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), FarmError::InvalidAsset);
    EXPECT_EQ(engine.pool_length(), 0);
    EXPECT_EQ(engine.total_allocation_weight(), 0);
}

TEST_F(Governance, add_pool_layout)
{
    EXPECT_EQ(add_pool(LP, 10, 0), 0);
    EXPECT_EQ(add_pool(LP2, 30, 20), 1);
    EXPECT_EQ(engine.pool_length(), 2);
    EXPECT_EQ(engine.total_allocation_weight(), 40);

    auto const pool = engine.pool(1).value();
    EXPECT_EQ(pool.staked_asset, LP2);
    EXPECT_EQ(pool.alloc_weight, 30);
    EXPECT_EQ(pool.last_refresh_tick, 20);
    EXPECT_EQ(pool.acc_reward_per_share, 0);
}

TEST_F(Governance, add_pool_without_update_dilutes_unrefreshed_pools)
{
    auto const p0 = add_pool(LP);
    ASSERT_FALSE(engine.deposit(ALICE, p0, 100, 0).has_error());

    add_pool(LP2, 1, 100);
    EXPECT_EQ(pending(p0, ALICE, 100), 4000);
}

TEST_F(Governance, add_pool_with_update)
{
    auto const p0 = add_pool(LP);
    ASSERT_FALSE(engine.deposit(ALICE, p0, 100, 0).has_error());

    ASSERT_FALSE(engine.add_pool(OWNER, 1, LP2, true, 100).has_error());
    EXPECT_EQ(last_refresh(p0), 100);
    EXPECT_EQ(pending(p0, ALICE, 100), 8000);
    EXPECT_EQ(pending(p0, ALICE, 200), 8000 + 4000);
}

TEST_F(Governance, set_pool_refreshes_target_first)
{
    auto const p0 = add_pool(LP);
    add_pool(LP2);
    ASSERT_FALSE(engine.deposit(ALICE, p0, 100, 0).has_error());

    ASSERT_FALSE(engine.set_pool(OWNER, p0, 3, false, 100).has_error());
    EXPECT_EQ(engine.total_allocation_weight(), 4);
    EXPECT_EQ(last_refresh(p0), 100);
    EXPECT_EQ(pending(p0, ALICE, 100), 4000);
    EXPECT_EQ(pending(p0, ALICE, 200), 4000 + 6000);
}

TEST_F(Governance, set_pool_with_update)
{
    auto const p0 = add_pool(LP);
    auto const p1 = add_pool(LP2);
    ASSERT_FALSE(engine.deposit(ALICE, p1, 100, 0).has_error());

    ASSERT_FALSE(engine.set_pool(OWNER, p0, 0, true, 100).has_error());
    EXPECT_EQ(last_refresh(p0), 100);
    EXPECT_EQ(last_refresh(p1), 100);
    EXPECT_EQ(engine.total_allocation_weight(), 1);
    EXPECT_EQ(pending(p1, ALICE, 200), 4000 + 8000);
}

TEST_F(Governance, set_pool_rejections)
{
    auto const p0 = add_pool(LP);

    auto const unauthorized = engine.set_pool(BOB, p0, 7, false, 0);
    ASSERT_TRUE(unauthorized.has_error());
    EXPECT_EQ(unauthorized.assume_error(), FarmError::Unauthorized);

    auto const unknown = engine.set_pool(OWNER, 3, 7, false, 0);
    ASSERT_TRUE(unknown.has_error());
    EXPECT_EQ(unknown.assume_error(), FarmError::UnknownPool);

    EXPECT_EQ(engine.pool(p0).value().alloc_weight, 1);
}

TEST_F(Governance, transfer_ownership)
{
    auto const rejected = engine.transfer_ownership(ALICE, ALICE);
    ASSERT_TRUE(rejected.has_error());
    EXPECT_EQ(rejected.assume_error(), FarmError::Unauthorized);

    auto const null = engine.transfer_ownership(OWNER, NULL_ADDRESS);
    ASSERT_TRUE(null.has_error());
    EXPECT_EQ(null.assume_error(), FarmError::InvalidAddress);

    ASSERT_FALSE(engine.transfer_ownership(OWNER, ALICE).has_error());
    EXPECT_EQ(engine.owner(), ALICE);

    auto const &event = state.logs().back();
    EXPECT_EQ(event.address, FARM);
    ASSERT_EQ(event.topics.size(), 3u);
    EXPECT_EQ(
        event.topics[0],
        0x8be0079c531659141344cd1fd0a4f28419497f9722a3daafe3b4186f6b6457e0_bytes32);
    EXPECT_EQ(event.topics[1], abi_encode_address(OWNER));
    EXPECT_EQ(event.topics[2], abi_encode_address(ALICE));
    EXPECT_TRUE(event.data.empty());

    auto const stale = engine.add_pool(OWNER, 1, LP, false, 0);
    ASSERT_TRUE(stale.has_error());
    EXPECT_EQ(stale.assume_error(), FarmError::Unauthorized);
    EXPECT_FALSE(engine.add_pool(ALICE, 1, LP, false, 0).has_error());
}

TEST_F(Governance, set_dev_address)
{
    constexpr auto NEW_DEV =
        0x000000000000000000000000000000000000de02_address;

    auto const by_owner = engine.set_dev_address(OWNER, NEW_DEV);
    ASSERT_TRUE(by_owner.has_error());
    EXPECT_EQ(by_owner.assume_error(), FarmError::Unauthorized);

    auto const null = engine.set_dev_address(DEV, NULL_ADDRESS);
    ASSERT_TRUE(null.has_error());
    EXPECT_EQ(null.assume_error(), FarmError::InvalidAddress);

    ASSERT_FALSE(engine.set_dev_address(DEV, NEW_DEV).has_error());
    EXPECT_EQ(engine.dev_address(), NEW_DEV);

    auto const pool = add_pool(LP);
    ASSERT_FALSE(engine.deposit(ALICE, pool, 100, 0).has_error());
    ASSERT_FALSE(engine.update_pool(pool, 100).has_error());
    EXPECT_EQ(reward.balance_of(NEW_DEV), 800);
    EXPECT_EQ(reward.balance_of(DEV), 0);
}

TEST_F(Governance, migrate_without_migrator)
{
    auto const pool = add_pool(LP);
    auto const res = engine.migrate(pool, 0);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), FarmError::NoMigrator);
}

TEST_F(Governance, set_migrator_requires_owner)
{
    SwapMigrator migrator{lp_v2};
    auto const res = engine.set_migrator(ALICE, &migrator);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), FarmError::Unauthorized);
}

TEST_F(Governance, migrate)
{
    ASSERT_TRUE(tokens.add(lp_v2));
    SwapMigrator migrator{lp_v2};
    ASSERT_FALSE(engine.set_migrator(OWNER, &migrator).has_error());

    auto const pool = add_pool(LP);
    ASSERT_FALSE(engine.deposit(ALICE, pool, 100, 0).has_error());

    // anyone may trigger the migration
    ASSERT_FALSE(engine.migrate(pool, 10).has_error());
    EXPECT_EQ(engine.pool(pool).value().staked_asset, LP_V2);
    EXPECT_EQ(lp.balance_of(FARM), 0);
    EXPECT_EQ(lp_v2.balance_of(FARM), 100);

    ASSERT_FALSE(engine.withdraw(ALICE, pool, 100, 20).has_error());
    EXPECT_EQ(lp_v2.balance_of(ALICE), 100);
    EXPECT_EQ(lp_v2.balance_of(FARM), 0);
    EXPECT_EQ(reward.balance_of(ALICE), 20 * 80);

    // the old asset may back a new pool again
    EXPECT_EQ(add_pool(LP, 1, 20), 1);
}

TEST_F(Governance, migrate_balance_mismatch_rolls_back)
{
    ASSERT_TRUE(tokens.add(lp_v2));
    SwapMigrator migrator{lp_v2, 1};
    ASSERT_FALSE(engine.set_migrator(OWNER, &migrator).has_error());

    auto const pool = add_pool(LP);
    ASSERT_FALSE(engine.deposit(ALICE, pool, 100, 0).has_error());

    auto const res = engine.migrate(pool, 10);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), FarmError::MigrationBalanceMismatch);

    EXPECT_EQ(engine.pool(pool).value().staked_asset, LP);
    EXPECT_EQ(lp.balance_of(FARM), 100);
    EXPECT_EQ(lp.allowance(FARM, MIGRATOR), 0);
    EXPECT_EQ(lp_v2.total_supply(), 0);
}

TEST_F(Governance, migrate_to_unregistered_asset)
{
    SwapMigrator migrator{lp_v2};
    ASSERT_FALSE(engine.set_migrator(OWNER, &migrator).has_error());

    auto const pool = add_pool(LP);
    ASSERT_FALSE(engine.deposit(ALICE, pool, 100, 0).has_error());

    auto const res = engine.migrate(pool, 10);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), FarmError::UnknownAsset);
    EXPECT_EQ(lp.balance_of(FARM), 100);
}

TEST_F(Governance, migrate_to_reward_token)
{
    RewardMigrator migrator;
    ASSERT_FALSE(engine.set_migrator(OWNER, &migrator).has_error());

    auto const pool = add_pool(LP);
    ASSERT_FALSE(engine.deposit(ALICE, pool, 100, 0).has_error());

    auto const res = engine.migrate(pool, 10);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), FarmError::InvalidAsset);
    EXPECT_EQ(engine.pool(pool).value().staked_asset, LP);
    EXPECT_EQ(lp.balance_of(FARM), 100);
    EXPECT_EQ(lp.balance_of(MIGRATOR), 0);

    // principal is still withdrawable
    ASSERT_FALSE(engine.withdraw(ALICE, pool, 100, 20).has_error());
    EXPECT_EQ(lp.balance_of(ALICE), 1000);
}
