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
#include <harvest/contract/big_endian.hpp>
#include <harvest/farm/farm_variables.hpp>
#include <harvest/farm/pool_accounting.hpp>
#include <harvest/farm/pool_info.hpp>
#include <harvest/farm/position_info.hpp>
#include <harvest/farm/reward_schedule.hpp>

#include <cstdint>

HARVEST_NAMESPACE_BEGIN

class FungibleToken;
class Migrator;
class MintableToken;
class State;
class TokenRegistry;
struct FarmParams;

// Caller facing state machine of a farm. Every mutating action runs inside
// its own State version and leaves no trace when it fails.
//
// The reward token must name the farm address as its minter. Staked assets
// are resolved through the registry.
class StakingEngine
{
    State &state_;
    Address const farm_;
    TokenRegistry const &tokens_;
    MintableToken &reward_token_;
    RewardSchedule const schedule_;
    FarmVariables vars_;
    PoolAccounting accounting_;
    Migrator *migrator_{nullptr};

public:
    StakingEngine(
        State &, Address const &farm, FarmParams const &,
        MintableToken &reward_token, TokenRegistry const &);

    StakingEngine(StakingEngine const &) = delete;
    StakingEngine &operator=(StakingEngine const &) = delete;

private:
    template <typename F>
    auto transact(F &&);

    Result<void> advance_clock(uint64_t now);
    Result<void> only_owner(Address const &caller) const;
    Result<FungibleToken *> staked_token(uint64_t pool) const;
    Result<void> safe_reward_transfer(Address const &to, uint256_t const &);

    /////////////
    // Events //
    /////////////

    // event Deposit(
    //     address indexed user,
    //     uint256 indexed pid,
    //     uint256         amount);
    void emit_deposit_event(
        Address const &participant, u64_be pool, u256_be const &amount);

    // event Withdraw(
    //     address indexed user,
    //     uint256 indexed pid,
    //     uint256         amount);
    void emit_withdraw_event(
        Address const &participant, u64_be pool, u256_be const &amount);

    // event EmergencyWithdraw(
    //     address indexed user,
    //     uint256 indexed pid,
    //     uint256         amount);
    void emit_emergency_withdraw_event(
        Address const &participant, u64_be pool, u256_be const &amount);

    // event OwnershipTransferred(
    //     address indexed previousOwner,
    //     address indexed newOwner);
    void emit_ownership_transferred_event(
        Address const &previous, Address const &next);

public:
    ////////////////////
    //  Participants  //
    ////////////////////

    // amount 0 only claims the pending reward
    Result<void> deposit(
        Address const &participant, uint64_t pool, uint256_t const &amount,
        uint64_t now);

    Result<void> withdraw(
        Address const &participant, uint64_t pool, uint256_t const &amount,
        uint64_t now);

    // returns the whole stake, pending reward is forfeited
    Result<void> emergency_withdraw(
        Address const &participant, uint64_t pool, uint64_t now);

    Result<uint256_t> pending_reward(
        uint64_t pool, Address const &participant, uint64_t now) const;

    //////////////////
    //  Governance  //
    //////////////////
    Result<uint64_t> add_pool(
        Address const &caller, uint256_t const &weight,
        Address const &staked_asset, bool with_update, uint64_t now);

    Result<void> set_pool(
        Address const &caller, uint64_t pool, uint256_t const &weight,
        bool with_update, uint64_t now);

    // nullptr disables migration. The migrator is not persisted.
    Result<void> set_migrator(Address const &caller, Migrator *);

    Result<void> migrate(uint64_t pool, uint64_t now);

    Result<void>
    transfer_ownership(Address const &caller, Address const &new_owner);

    Result<void> set_dev_address(Address const &caller, Address const &dev);

    Result<void> update_pool(uint64_t pool, uint64_t now);
    Result<void> mass_update_pools(uint64_t now);

    ///////////////
    //  Queries  //
    ///////////////
    Address const &address() const noexcept;
    RewardSchedule const &schedule() const noexcept;
    uint64_t pool_length() const noexcept;
    Result<Pool> pool(uint64_t) const;
    Result<Position> position(uint64_t pool, Address const &) const;
    uint256_t total_allocation_weight() const noexcept;
    Address owner() const noexcept;
    Address dev_address() const noexcept;
    uint64_t latest_tick() const noexcept;
};

HARVEST_NAMESPACE_END
