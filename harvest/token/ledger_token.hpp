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
#include <harvest/contract/storage_variable.hpp>
#include <harvest/token/token.hpp>

#include <string>

HARVEST_NAMESPACE_BEGIN

class State;

// A fungible token whose balances and allowances live in State, so every
// movement is covered by the caller's State checkpoints.
class LedgerToken final : public MintableToken
{
    static constexpr auto AddressTotalSupply{
        0x0000000000000000000000000000000000000000000000000000000000000001_bytes32};
    static constexpr auto AddressMinter{
        0x0000000000000000000000000000000000000000000000000000000000000002_bytes32};

    State &state_;
    Address const address_;
    std::string symbol_;

    StorageVariable<u256_be> supply() noexcept;
    StorageVariable<u256_be> const supply() const noexcept;
    StorageVariable<Address> minter_var() noexcept;
    StorageVariable<Address> const minter_var() const noexcept;

    void emit_transfer_event(
        Address const &from, Address const &to, uint256_t const &amount);
    void emit_approval_event(
        Address const &owner, Address const &spender, uint256_t const &amount);

    Result<void> move(
        Address const &from, Address const &to, uint256_t const &amount);

public:
    LedgerToken(State &, Address const &, std::string symbol);

    std::string const &symbol() const noexcept;

    Address minter() const noexcept;
    void set_minter(Address const &);

    Address const &address() const noexcept override;
    uint256_t total_supply() const override;
    uint256_t balance_of(Address const &holder) const override;
    uint256_t
    allowance(Address const &owner, Address const &spender) const override;

    Result<void> transfer(
        Address const &sender, Address const &recipient,
        uint256_t const &amount) override;
    Result<void> transfer_from(
        Address const &spender, Address const &owner,
        Address const &recipient, uint256_t const &amount) override;
    Result<void> approve(
        Address const &owner, Address const &spender,
        uint256_t const &amount) override;
    Result<void> mint(
        Address const &caller, Address const &recipient,
        uint256_t const &amount) override;
};

HARVEST_NAMESPACE_END
