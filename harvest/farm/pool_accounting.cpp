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
#include <harvest/core/fmt/address_fmt.hpp>
#include <harvest/core/fmt/int_fmt.hpp>
#include <harvest/core/likely.h>
#include <harvest/farm/constants.hpp>
#include <harvest/farm/farm_error.hpp>
#include <harvest/farm/farm_variables.hpp>
#include <harvest/farm/pool_accounting.hpp>
#include <harvest/farm/reward_schedule.hpp>
#include <harvest/token/token.hpp>
#include <harvest/token/token_registry.hpp>

#include <intx/intx.hpp>
#include <quill/Quill.h>

#include <limits>
#include <optional>

HARVEST_ANONYMOUS_NAMESPACE_BEGIN

// floor(a * b / d), nullopt if a * b does not fit
std::optional<uint256_t>
mul_div(uint256_t const &a, uint256_t const &b, uint256_t const &d)
{
    if (b != 0 && a > std::numeric_limits<uint256_t>::max() / b) {
        return std::nullopt;
    }
    return a * b / d;
}

HARVEST_ANONYMOUS_NAMESPACE_END

HARVEST_NAMESPACE_BEGIN

PoolAccounting::PoolAccounting(
    FarmVariables &vars, Address const &farm, RewardSchedule const &schedule,
    TokenRegistry const &tokens, MintableToken &reward_token)
    : vars_{vars}
    , farm_{farm}
    , schedule_{schedule}
    , accumulator_{schedule}
    , tokens_{tokens}
    , reward_token_{reward_token}
{
}

Result<Accrual>
PoolAccounting::simulate(uint64_t const pool_id, uint64_t const now) const
{
    if (HARVEST_UNLIKELY(pool_id >= vars_.pool_assets.length())) {
        return FarmError::UnknownPool;
    }
    auto const pool = vars_.pool(pool_id);

    Accrual accrual{
        .pool_reward = 0,
        .dev_reward = 0,
        .acc_reward_per_share = pool.acc_reward_per_share().load().native(),
        .last_refresh_tick = pool.last_refresh_tick().load().native()};
    if (now <= accrual.last_refresh_tick) {
        return accrual;
    }

    Address const asset = vars_.pool_assets.get(pool_id).load();
    FungibleToken const *const token = tokens_.find(asset);
    if (HARVEST_UNLIKELY(token == nullptr)) {
        LOG_ERROR(
            "Harvest: pool {} stakes unregistered asset {}", pool_id, asset);
        return FarmError::UnknownAsset;
    }

    uint256_t const staked_balance = token->balance_of(farm_);
    uint256_t const weight = pool.alloc_weight().load().native();
    uint256_t const total_weight = vars_.total_weight.load().native();
    if (staked_balance == 0 || weight == 0 || total_weight == 0) {
        // reward for the interval is dropped
        accrual.last_refresh_tick = now;
        return accrual;
    }

    BOOST_OUTCOME_TRY(
        auto const emitted,
        accumulator_.integrate(accrual.last_refresh_tick, now));
    auto const pool_reward = mul_div(emitted, weight, total_weight);
    if (HARVEST_UNLIKELY(!pool_reward.has_value())) {
        LOG_ERROR(
            "Harvest: pool {} reward overflow, emitted={} weight={}",
            pool_id,
            emitted,
            weight);
        return FarmError::InternalError;
    }
    auto const delta = mul_div(pool_reward.value(), PRECISION, staked_balance);
    if (HARVEST_UNLIKELY(!delta.has_value())) {
        LOG_ERROR(
            "Harvest: pool {} accumulator overflow, reward={} staked={}",
            pool_id,
            pool_reward.value(),
            staked_balance);
        return FarmError::InternalError;
    }
    auto const [acc, carry] =
        intx::addc(accrual.acc_reward_per_share, delta.value());
    if (HARVEST_UNLIKELY(carry)) {
        LOG_ERROR("Harvest: pool {} accumulator wrapped", pool_id);
        return FarmError::InternalError;
    }

    BOOST_OUTCOME_TRY(auto const epoch, schedule_.epoch_at(now));
    uint64_t const divisor = schedule_.dev_fee_divisor(epoch);

    accrual.pool_reward = pool_reward.value();
    accrual.dev_reward = divisor == 0 ? 0 : pool_reward.value() / divisor;
    accrual.acc_reward_per_share = acc;
    accrual.last_refresh_tick = now;
    return accrual;
}

Result<void> PoolAccounting::mint_reward(
    Address const &recipient, uint256_t const &amount)
{
    auto const res = reward_token_.mint(farm_, recipient, amount);
    if (HARVEST_UNLIKELY(res.has_error())) {
        LOG_ERROR(
            "Harvest: minting {} reward to {} failed: {}",
            amount,
            recipient,
            res.error().message().c_str());
        return FarmError::TransferFailed;
    }
    return outcome::success();
}

Result<void> PoolAccounting::refresh(uint64_t const pool_id, uint64_t const now)
{
    BOOST_OUTCOME_TRY(auto const accrual, simulate(pool_id, now));

    auto pool = vars_.pool(pool_id);
    if (accrual.last_refresh_tick == pool.last_refresh_tick().load().native()) {
        return outcome::success();
    }

    if (accrual.dev_reward > 0) {
        BOOST_OUTCOME_TRY(
            mint_reward(vars_.dev_address.load(), accrual.dev_reward));
    }
    if (accrual.pool_reward > 0) {
        BOOST_OUTCOME_TRY(mint_reward(farm_, accrual.pool_reward));
    }

    pool.acc_reward_per_share().store(accrual.acc_reward_per_share);
    pool.last_refresh_tick().store(accrual.last_refresh_tick);

    LOG_DEBUG(
        "Harvest: refreshed pool {} to tick {}, reward={} dev={} acc={}",
        pool_id,
        accrual.last_refresh_tick,
        accrual.pool_reward,
        accrual.dev_reward,
        accrual.acc_reward_per_share);
    return outcome::success();
}

Result<void> PoolAccounting::refresh_all(uint64_t const now)
{
    uint64_t const length = vars_.pool_assets.length();
    for (uint64_t pool_id = 0; pool_id < length; ++pool_id) {
        BOOST_OUTCOME_TRY(refresh(pool_id, now));
    }
    return outcome::success();
}

HARVEST_NAMESPACE_END
