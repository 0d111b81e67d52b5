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
#include <harvest/core/int.hpp>
#include <harvest/farm/constants.hpp>
#include <harvest/farm/farm_params.hpp>
#include <harvest/farm/staking_engine.hpp>
#include <harvest/state/state.hpp>
#include <harvest/token/ledger_token.hpp>
#include <harvest/token/token_registry.hpp>

#include <gtest/gtest.h>

#include <cstdint>
#include <limits>

namespace harvest::test
{
    constexpr auto FARM = DEFAULT_FARM_ADDRESS;
    constexpr auto REWARD = DEFAULT_REWARD_TOKEN_ADDRESS;
    constexpr auto LP = 0x0000000000000000000000000000000000002001_address;
    constexpr auto LP2 = 0x0000000000000000000000000000000000002002_address;
    constexpr auto LP_MINTER =
        0x00000000000000000000000000000000000020ff_address;
    constexpr auto OWNER = 0x000000000000000000000000000000000000a001_address;
    constexpr auto DEV = 0x000000000000000000000000000000000000de01_address;
    constexpr auto ALICE = 0x000000000000000000000000000000000000a11c_address;
    constexpr auto BOB = 0x0000000000000000000000000000000000000b0b_address;

    // genesis 0, epochs of 100 ticks, rates 80 80 20 10
    inline FarmParams make_params()
    {
        FarmParams params{};
        params.genesis_tick = 0;
        params.epoch_length = 100;
        params.rates = {80, 80, 20, 10};
        params.dev_fee_divisors = {10, 10, 20};
        params.owner = OWNER;
        params.dev_address = DEV;
        return params;
    }

    struct Farm : public ::testing::Test
    {
        State state{};
        LedgerToken reward{state, REWARD, "RWD"};
        LedgerToken lp{state, LP, "LP"};
        LedgerToken lp2{state, LP2, "LP2"};
        TokenRegistry tokens{};
        StakingEngine engine{state, FARM, make_params(), reward, tokens};

        void SetUp() override
        {
            ASSERT_TRUE(tokens.add(reward));
            ASSERT_TRUE(tokens.add(lp));
            ASSERT_TRUE(tokens.add(lp2));
            reward.set_minter(FARM);
            lp.set_minter(LP_MINTER);
            lp2.set_minter(LP_MINTER);
            fund(lp, ALICE, 1000);
            fund(lp, BOB, 1000);
            fund(lp2, ALICE, 1000);
        }

        void fund(LedgerToken &token, Address const &holder, uint64_t amount)
        {
            ASSERT_FALSE(token.mint(LP_MINTER, holder, amount).has_error());
            ASSERT_FALSE(
                token
                    .approve(
                        holder, FARM, std::numeric_limits<uint256_t>::max())
                    .has_error());
        }

        uint64_t add_pool(
            Address const &asset, uint64_t weight = 1, uint64_t now = 0)
        {
            auto const res = engine.add_pool(OWNER, weight, asset, false, now);
            EXPECT_FALSE(res.has_error());
            return res.value();
        }

        uint256_t pending(uint64_t pool, Address const &who, uint64_t now)
        {
            auto const res = engine.pending_reward(pool, who, now);
            EXPECT_FALSE(res.has_error());
            return res.value();
        }

        uint256_t acc(uint64_t pool)
        {
            return engine.pool(pool).value().acc_reward_per_share;
        }

        uint64_t last_refresh(uint64_t pool)
        {
            return engine.pool(pool).value().last_refresh_tick;
        }
    };
}
