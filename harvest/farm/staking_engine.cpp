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

#include <harvest/contract/big_endian.hpp>
#include <harvest/contract/events.hpp>
#include <harvest/core/address.hpp>
#include <harvest/core/fmt/address_fmt.hpp>
#include <harvest/core/fmt/int_fmt.hpp>
#include <harvest/core/likely.h>
#include <harvest/farm/constants.hpp>
#include <harvest/farm/farm_error.hpp>
#include <harvest/farm/farm_params.hpp>
#include <harvest/farm/migrator.hpp>
#include <harvest/farm/staking_engine.hpp>
#include <harvest/state/state.hpp>
#include <harvest/token/token.hpp>
#include <harvest/token/token_registry.hpp>

#include <intx/intx.hpp>
#include <quill/Quill.h>

#include <algorithm>
#include <cstdint>
#include <utility>

HARVEST_ANONYMOUS_NAMESPACE_BEGIN

uint256_t reward_debt(uint256_t const &amount, uint256_t const &acc)
{
    return amount * acc / PRECISION;
}

uint256_t pending_of(Position const &position, uint256_t const &acc)
{
    auto const owed =
        intx::subc(reward_debt(position.amount, acc), position.reward_debt);
    if (HARVEST_UNLIKELY(owed.carry)) {
        return 0;
    }
    return owed.value;
}

HARVEST_ANONYMOUS_NAMESPACE_END

HARVEST_NAMESPACE_BEGIN

StakingEngine::StakingEngine(
    State &state, Address const &farm, FarmParams const &params,
    MintableToken &reward_token, TokenRegistry const &tokens)
    : state_{state}
    , farm_{farm}
    , tokens_{tokens}
    , reward_token_{reward_token}
    , schedule_{params}
    , vars_{state, farm_}
    , accounting_{vars_, farm_, schedule_, tokens, reward_token}
{
    // an existing farm keeps its owner and dev address
    if (!vars_.owner.load_checked().has_value()) {
        vars_.owner.store(params.owner);
        vars_.dev_address.store(params.dev_address);
    }
}

template <typename F>
auto StakingEngine::transact(F &&action)
{
    state_.push();
    auto res = std::forward<F>(action)();
    if (res.has_error()) {
        state_.pop_reject();
    }
    else {
        state_.pop_accept();
    }
    return res;
}

Result<void> StakingEngine::advance_clock(uint64_t const now)
{
    uint64_t const latest = vars_.latest_tick.load().native();
    if (HARVEST_UNLIKELY(now < latest)) {
        LOG_WARNING(
            "Harvest: action at tick {} after tick {} was executed",
            now,
            latest);
        return FarmError::TickRegression;
    }
    vars_.latest_tick.store(now);
    return outcome::success();
}

Result<void> StakingEngine::only_owner(Address const &caller) const
{
    if (HARVEST_UNLIKELY(caller != vars_.owner.load())) {
        LOG_WARNING("Harvest: {} is not the owner", caller);
        return FarmError::Unauthorized;
    }
    return outcome::success();
}

Result<FungibleToken *> StakingEngine::staked_token(uint64_t const pool) const
{
    if (HARVEST_UNLIKELY(pool >= vars_.pool_assets.length())) {
        return FarmError::UnknownPool;
    }
    Address const asset = vars_.pool_assets.get(pool).load();
    FungibleToken *const token = tokens_.find(asset);
    if (HARVEST_UNLIKELY(token == nullptr)) {
        LOG_ERROR("Harvest: pool {} stakes unregistered asset {}", pool, asset);
        return FarmError::UnknownAsset;
    }
    return token;
}

// Pays min(amount, reward balance of the farm). The shortfall stays owed by
// nobody: rounding leaves the farm slightly short of the sum of pending
// rewards.
Result<void> StakingEngine::safe_reward_transfer(
    Address const &to, uint256_t const &amount)
{
    if (amount == 0) {
        return outcome::success();
    }
    uint256_t const balance = reward_token_.balance_of(farm_);
    uint256_t const paid = std::min(amount, balance);
    if (HARVEST_UNLIKELY(paid < amount)) {
        LOG_WARNING(
            "Harvest: reward shortfall paying {}, owed={} available={}",
            to,
            amount,
            balance);
    }
    if (paid == 0) {
        return outcome::success();
    }
    auto const res = reward_token_.transfer(farm_, to, paid);
    if (HARVEST_UNLIKELY(res.has_error())) {
        LOG_ERROR(
            "Harvest: reward transfer of {} to {} failed: {}",
            paid,
            to,
            res.error().message().c_str());
        return FarmError::TransferFailed;
    }
    return outcome::success();
}

/////////////
// Events //
/////////////
void StakingEngine::emit_deposit_event(
    Address const &participant, u64_be const pool, u256_be const &amount)
{
    // keccak256("Deposit(address,uint256,uint256)")
    constexpr bytes32_t signature{
        0x90890809c654f11d6e72a28fa60149770a0d11ec6c92319d6ceb2bb0a4ea1a15_bytes32};
    EventBuilder(farm_, signature)
        .topic(participant)
        .topic(pool)
        .data(amount)
        .emit(state_);
}

void StakingEngine::emit_withdraw_event(
    Address const &participant, u64_be const pool, u256_be const &amount)
{
    // keccak256("Withdraw(address,uint256,uint256)")
    constexpr bytes32_t signature{
        0xf279e6a1f5e320cca91135676d9cb6e44ca8a08c0b88342bcdb1144f6511b568_bytes32};
    EventBuilder(farm_, signature)
        .topic(participant)
        .topic(pool)
        .data(amount)
        .emit(state_);
}

void StakingEngine::emit_emergency_withdraw_event(
    Address const &participant, u64_be const pool, u256_be const &amount)
{
    // keccak256("EmergencyWithdraw(address,uint256,uint256)")
    constexpr bytes32_t signature{
        0xbb757047c2b5f3974fe26b7c10f732e7bce710b0952a71082702781e62ae0595_bytes32};
    EventBuilder(farm_, signature)
        .topic(participant)
        .topic(pool)
        .data(amount)
        .emit(state_);
}

void StakingEngine::emit_ownership_transferred_event(
    Address const &previous, Address const &next)
{
    // keccak256("OwnershipTransferred(address,address)")
    constexpr bytes32_t signature{
        0x8be0079c531659141344cd1fd0a4f28419497f9722a3daafe3b4186f6b6457e0_bytes32};
    EventBuilder(farm_, signature).topic(previous).topic(next).emit(state_);
}

////////////////////
//  Participants  //
////////////////////
Result<void> StakingEngine::deposit(
    Address const &participant, uint64_t const pool, uint256_t const &amount,
    uint64_t const now)
{
    return transact([&]() -> Result<void> {
        BOOST_OUTCOME_TRY(advance_clock(now));
        BOOST_OUTCOME_TRY(FungibleToken *const asset, staked_token(pool));
        BOOST_OUTCOME_TRY(accounting_.refresh(pool, now));

        uint256_t const acc =
            vars_.pool(pool).acc_reward_per_share().load().native();
        auto position = vars_.position(pool, participant);
        Position current = position.load();

        if (current.amount > 0) {
            BOOST_OUTCOME_TRY(
                safe_reward_transfer(participant, pending_of(current, acc)));
        }
        if (amount > 0) {
            auto const res =
                asset->transfer_from(farm_, participant, farm_, amount);
            if (HARVEST_UNLIKELY(res.has_error())) {
                LOG_WARNING(
                    "Harvest: deposit of {} by {} into pool {} rejected: {}",
                    amount,
                    participant,
                    pool,
                    res.error().message().c_str());
                return FarmError::TransferFailed;
            }
            current.amount += amount;
        }
        position.amount().store(current.amount);
        position.reward_debt().store(reward_debt(current.amount, acc));

        emit_deposit_event(participant, pool, amount);
        return outcome::success();
    });
}

Result<void> StakingEngine::withdraw(
    Address const &participant, uint64_t const pool, uint256_t const &amount,
    uint64_t const now)
{
    return transact([&]() -> Result<void> {
        BOOST_OUTCOME_TRY(advance_clock(now));
        BOOST_OUTCOME_TRY(FungibleToken *const asset, staked_token(pool));

        auto position = vars_.position(pool, participant);
        Position current = position.load();
        if (HARVEST_UNLIKELY(amount > current.amount)) {
            return FarmError::InsufficientStake;
        }

        BOOST_OUTCOME_TRY(accounting_.refresh(pool, now));
        uint256_t const acc =
            vars_.pool(pool).acc_reward_per_share().load().native();

        BOOST_OUTCOME_TRY(
            safe_reward_transfer(participant, pending_of(current, acc)));

        current.amount -= amount;
        if (amount > 0) {
            auto const res = asset->transfer(farm_, participant, amount);
            if (HARVEST_UNLIKELY(res.has_error())) {
                LOG_ERROR(
                    "Harvest: returning {} of pool {} to {} failed: {}",
                    amount,
                    pool,
                    participant,
                    res.error().message().c_str());
                return FarmError::TransferFailed;
            }
        }
        position.amount().store(current.amount);
        position.reward_debt().store(reward_debt(current.amount, acc));

        emit_withdraw_event(participant, pool, amount);
        return outcome::success();
    });
}

Result<void> StakingEngine::emergency_withdraw(
    Address const &participant, uint64_t const pool, uint64_t const now)
{
    return transact([&]() -> Result<void> {
        BOOST_OUTCOME_TRY(advance_clock(now));
        BOOST_OUTCOME_TRY(FungibleToken *const asset, staked_token(pool));

        auto position = vars_.position(pool, participant);
        uint256_t const amount = position.amount().load().native();
        if (amount > 0) {
            auto const res = asset->transfer(farm_, participant, amount);
            if (HARVEST_UNLIKELY(res.has_error())) {
                LOG_ERROR(
                    "Harvest: emergency withdraw of {} from pool {} to {} "
                    "failed: {}",
                    amount,
                    pool,
                    participant,
                    res.error().message().c_str());
                return FarmError::TransferFailed;
            }
        }
        position.amount().store(u256_be{0});
        position.reward_debt().store(u256_be{0});

        emit_emergency_withdraw_event(participant, pool, amount);
        return outcome::success();
    });
}

Result<uint256_t> StakingEngine::pending_reward(
    uint64_t const pool, Address const &participant, uint64_t const now) const
{
    BOOST_OUTCOME_TRY(auto const accrual, accounting_.simulate(pool, now));
    Position const current = vars_.position(pool, participant).load();
    return pending_of(current, accrual.acc_reward_per_share);
}

//////////////////
//  Governance  //
//////////////////
Result<uint64_t> StakingEngine::add_pool(
    Address const &caller, uint256_t const &weight,
    Address const &staked_asset, bool const with_update, uint64_t const now)
{
    return transact([&]() -> Result<uint64_t> {
        BOOST_OUTCOME_TRY(only_owner(caller));
        BOOST_OUTCOME_TRY(advance_clock(now));
        if (HARVEST_UNLIKELY(!tokens_.contains(staked_asset))) {
            return FarmError::UnknownAsset;
        }
        // custody of the reward token also holds unclaimed rewards
        if (HARVEST_UNLIKELY(staked_asset == reward_token_.address())) {
            return FarmError::InvalidAsset;
        }
        if (HARVEST_UNLIKELY(
                vars_.asset_pool(staked_asset).load_checked().has_value())) {
            return FarmError::DuplicatePool;
        }
        if (with_update) {
            BOOST_OUTCOME_TRY(accounting_.refresh_all(now));
        }

        uint64_t const id = vars_.pool_assets.length();
        uint256_t const total = vars_.total_weight.load().native();
        vars_.total_weight.store(total + weight);

        vars_.pool_assets.push(staked_asset);
        auto pool = vars_.pool(id);
        pool.alloc_weight().store(weight);
        pool.last_refresh_tick().store(
            std::max(now, schedule_.genesis_tick()));
        pool.acc_reward_per_share().store(u256_be{0});
        vars_.asset_pool(staked_asset).store(id + 1);

        LOG_INFO(
            "Harvest: added pool {} staking {} with weight {}",
            id,
            staked_asset,
            weight);
        return id;
    });
}

Result<void> StakingEngine::set_pool(
    Address const &caller, uint64_t const pool, uint256_t const &weight,
    bool const with_update, uint64_t const now)
{
    return transact([&]() -> Result<void> {
        BOOST_OUTCOME_TRY(only_owner(caller));
        BOOST_OUTCOME_TRY(advance_clock(now));
        BOOST_OUTCOME_TRY(staked_token(pool));
        if (with_update) {
            BOOST_OUTCOME_TRY(accounting_.refresh_all(now));
        }
        else {
            BOOST_OUTCOME_TRY(accounting_.refresh(pool, now));
        }

        auto info = vars_.pool(pool);
        uint256_t const previous = info.alloc_weight().load().native();
        uint256_t const total = vars_.total_weight.load().native();
        vars_.total_weight.store(total - previous + weight);
        info.alloc_weight().store(weight);

        LOG_INFO(
            "Harvest: pool {} weight {} -> {}", pool, previous, weight);
        return outcome::success();
    });
}

Result<void>
StakingEngine::set_migrator(Address const &caller, Migrator *const migrator)
{
    BOOST_OUTCOME_TRY(only_owner(caller));
    migrator_ = migrator;
    return outcome::success();
}

Result<void> StakingEngine::migrate(uint64_t const pool, uint64_t const now)
{
    return transact([&]() -> Result<void> {
        if (HARVEST_UNLIKELY(migrator_ == nullptr)) {
            return FarmError::NoMigrator;
        }
        BOOST_OUTCOME_TRY(advance_clock(now));
        BOOST_OUTCOME_TRY(FungibleToken *const old_asset, staked_token(pool));

        uint256_t const balance = old_asset->balance_of(farm_);
        auto const approved =
            old_asset->approve(farm_, migrator_->address(), balance);
        if (HARVEST_UNLIKELY(approved.has_error())) {
            LOG_ERROR(
                "Harvest: approving migrator {} failed: {}",
                migrator_->address(),
                approved.error().message().c_str());
            return FarmError::TransferFailed;
        }

        BOOST_OUTCOME_TRY(
            Address const replacement, migrator_->migrate(*old_asset));
        FungibleToken const *const new_asset = tokens_.find(replacement);
        if (HARVEST_UNLIKELY(new_asset == nullptr)) {
            return FarmError::UnknownAsset;
        }
        if (HARVEST_UNLIKELY(replacement == reward_token_.address())) {
            return FarmError::InvalidAsset;
        }
        if (HARVEST_UNLIKELY(
                replacement != old_asset->address() &&
                vars_.asset_pool(replacement).load_checked().has_value())) {
            return FarmError::DuplicatePool;
        }
        uint256_t const migrated = new_asset->balance_of(farm_);
        if (HARVEST_UNLIKELY(migrated != balance)) {
            LOG_WARNING(
                "Harvest: migration of pool {} changed custody {} -> {}",
                pool,
                balance,
                migrated);
            return FarmError::MigrationBalanceMismatch;
        }

        vars_.asset_pool(old_asset->address()).clear();
        vars_.pool_assets.get(pool).store(replacement);
        vars_.asset_pool(replacement).store(pool + 1);

        LOG_INFO(
            "Harvest: migrated pool {} from {} to {}",
            pool,
            old_asset->address(),
            replacement);
        return outcome::success();
    });
}

Result<void> StakingEngine::transfer_ownership(
    Address const &caller, Address const &new_owner)
{
    return transact([&]() -> Result<void> {
        BOOST_OUTCOME_TRY(only_owner(caller));
        if (HARVEST_UNLIKELY(new_owner == NULL_ADDRESS)) {
            return FarmError::InvalidAddress;
        }
        vars_.owner.store(new_owner);
        emit_ownership_transferred_event(caller, new_owner);
        return outcome::success();
    });
}

Result<void>
StakingEngine::set_dev_address(Address const &caller, Address const &dev)
{
    return transact([&]() -> Result<void> {
        if (HARVEST_UNLIKELY(caller != vars_.dev_address.load())) {
            LOG_WARNING("Harvest: {} is not the dev address", caller);
            return FarmError::Unauthorized;
        }
        if (HARVEST_UNLIKELY(dev == NULL_ADDRESS)) {
            return FarmError::InvalidAddress;
        }
        vars_.dev_address.store(dev);
        return outcome::success();
    });
}

Result<void> StakingEngine::update_pool(uint64_t const pool, uint64_t const now)
{
    return transact([&]() -> Result<void> {
        BOOST_OUTCOME_TRY(advance_clock(now));
        return accounting_.refresh(pool, now);
    });
}

Result<void> StakingEngine::mass_update_pools(uint64_t const now)
{
    return transact([&]() -> Result<void> {
        BOOST_OUTCOME_TRY(advance_clock(now));
        return accounting_.refresh_all(now);
    });
}

///////////////
//  Queries  //
///////////////
Address const &StakingEngine::address() const noexcept
{
    return farm_;
}

RewardSchedule const &StakingEngine::schedule() const noexcept
{
    return schedule_;
}

uint64_t StakingEngine::pool_length() const noexcept
{
    return vars_.pool_assets.length();
}

Result<Pool> StakingEngine::pool(uint64_t const id) const
{
    if (HARVEST_UNLIKELY(id >= pool_length())) {
        return FarmError::UnknownPool;
    }
    auto const info = vars_.pool(id);
    return Pool{
        .staked_asset = vars_.pool_assets.get(id).load(),
        .alloc_weight = info.alloc_weight().load().native(),
        .last_refresh_tick = info.last_refresh_tick().load().native(),
        .acc_reward_per_share = info.acc_reward_per_share().load().native()};
}

Result<Position>
StakingEngine::position(uint64_t const pool, Address const &participant) const
{
    if (HARVEST_UNLIKELY(pool >= pool_length())) {
        return FarmError::UnknownPool;
    }
    return vars_.position(pool, participant).load();
}

uint256_t StakingEngine::total_allocation_weight() const noexcept
{
    return vars_.total_weight.load().native();
}

Address StakingEngine::owner() const noexcept
{
    return vars_.owner.load();
}

Address StakingEngine::dev_address() const noexcept
{
    return vars_.dev_address.load();
}

uint64_t StakingEngine::latest_tick() const noexcept
{
    return vars_.latest_tick.load().native();
}

HARVEST_NAMESPACE_END
