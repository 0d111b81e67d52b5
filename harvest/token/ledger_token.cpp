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
#include <harvest/contract/storage_variable.hpp>
#include <harvest/core/address.hpp>
#include <harvest/core/fmt/address_fmt.hpp>
#include <harvest/core/fmt/int_fmt.hpp>
#include <harvest/core/likely.h>
#include <harvest/state/state.hpp>
#include <harvest/token/ledger_token.hpp>
#include <harvest/token/token_error.hpp>

#include <intx/intx.hpp>
#include <quill/Quill.h>

#include <limits>
#include <string>
#include <utility>

HARVEST_NAMESPACE_BEGIN

namespace
{
    // keccak256("Transfer(address,address,uint256)")
    constexpr auto TRANSFER_EVENT{
        0xddf252ad1be2c89b69c2b068fc378daa952ba7f163c4a11628f55a4df523b3ef_bytes32};

    // keccak256("Approval(address,address,uint256)")
    constexpr auto APPROVAL_EVENT{
        0x8c5be1e5ebec7d5bd14f71427d1e84f3dd0314c0f7b2291e5b200ac8c7c3b925_bytes32};
}

LedgerToken::LedgerToken(
    State &state, Address const &address, std::string symbol)
    : state_{state}
    , address_{address}
    , symbol_{std::move(symbol)}
{
}

StorageVariable<u256_be> LedgerToken::supply() noexcept
{
    return {state_, address_, AddressTotalSupply};
}

StorageVariable<u256_be> const LedgerToken::supply() const noexcept
{
    return {state_, address_, AddressTotalSupply};
}

StorageVariable<Address> LedgerToken::minter_var() noexcept
{
    return {state_, address_, AddressMinter};
}

StorageVariable<Address> const LedgerToken::minter_var() const noexcept
{
    return {state_, address_, AddressMinter};
}

std::string const &LedgerToken::symbol() const noexcept
{
    return symbol_;
}

Address LedgerToken::minter() const noexcept
{
    return minter_var().load();
}

void LedgerToken::set_minter(Address const &minter)
{
    minter_var().store(minter);
}

Address const &LedgerToken::address() const noexcept
{
    return address_;
}

uint256_t LedgerToken::total_supply() const
{
    return supply().load().native();
}

uint256_t LedgerToken::balance_of(Address const &holder) const
{
    return state_.get_balance(address_, holder);
}

uint256_t
LedgerToken::allowance(Address const &owner, Address const &spender) const
{
    return state_.get_allowance(address_, owner, spender);
}

void LedgerToken::emit_transfer_event(
    Address const &from, Address const &to, uint256_t const &amount)
{
    EventBuilder(address_, TRANSFER_EVENT)
        .topic(from)
        .topic(to)
        .data(u256_be{amount})
        .emit(state_);
}

void LedgerToken::emit_approval_event(
    Address const &owner, Address const &spender, uint256_t const &amount)
{
    EventBuilder(address_, APPROVAL_EVENT)
        .topic(owner)
        .topic(spender)
        .data(u256_be{amount})
        .emit(state_);
}

Result<void> LedgerToken::move(
    Address const &from, Address const &to, uint256_t const &amount)
{
    if (HARVEST_UNLIKELY(to == NULL_ADDRESS)) {
        return TokenError::InvalidRecipient;
    }
    if (HARVEST_UNLIKELY(balance_of(from) < amount)) {
        return TokenError::InsufficientBalance;
    }
    state_.subtract_from_balance(address_, from, amount);
    state_.add_to_balance(address_, to, amount);
    emit_transfer_event(from, to, amount);
    return outcome::success();
}

Result<void> LedgerToken::transfer(
    Address const &sender, Address const &recipient, uint256_t const &amount)
{
    return move(sender, recipient, amount);
}

Result<void> LedgerToken::transfer_from(
    Address const &spender, Address const &owner, Address const &recipient,
    uint256_t const &amount)
{
    auto const allowed = allowance(owner, spender);
    if (HARVEST_UNLIKELY(allowed < amount)) {
        return TokenError::InsufficientAllowance;
    }
    BOOST_OUTCOME_TRY(move(owner, recipient, amount));
    // an unlimited allowance is never consumed
    if (allowed != std::numeric_limits<uint256_t>::max()) {
        state_.set_allowance(address_, owner, spender, allowed - amount);
    }
    return outcome::success();
}

Result<void> LedgerToken::approve(
    Address const &owner, Address const &spender, uint256_t const &amount)
{
    if (HARVEST_UNLIKELY(spender == NULL_ADDRESS)) {
        return TokenError::InvalidRecipient;
    }
    state_.set_allowance(address_, owner, spender, amount);
    emit_approval_event(owner, spender, amount);
    return outcome::success();
}

Result<void> LedgerToken::mint(
    Address const &caller, Address const &recipient, uint256_t const &amount)
{
    if (HARVEST_UNLIKELY(caller != minter())) {
        LOG_WARNING(
            "{}: mint rejected, caller={} is not the minter",
            symbol_,
            caller);
        return TokenError::Unauthorized;
    }
    if (HARVEST_UNLIKELY(recipient == NULL_ADDRESS)) {
        return TokenError::InvalidRecipient;
    }
    uint256_t const current = total_supply();
    if (HARVEST_UNLIKELY(current + amount < current)) {
        return TokenError::SupplyOverflow;
    }
    supply().store(current + amount);
    state_.add_to_balance(address_, recipient, amount);
    emit_transfer_event(NULL_ADDRESS, recipient, amount);
    return outcome::success();
}

HARVEST_NAMESPACE_END
