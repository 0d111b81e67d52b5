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

HARVEST_NAMESPACE_BEGIN

// Minimal contract of a fungible asset. Transfers move exactly the requested
// amount or fail without side effects.
class FungibleToken
{
public:
    virtual ~FungibleToken() = default;

    virtual Address const &address() const noexcept = 0;

    virtual uint256_t total_supply() const = 0;

    virtual uint256_t balance_of(Address const &holder) const = 0;

    virtual uint256_t
    allowance(Address const &owner, Address const &spender) const = 0;

    virtual Result<void> transfer(
        Address const &sender, Address const &recipient,
        uint256_t const &amount) = 0;

    // spender moves `amount` out of owner's balance, consuming allowance
    virtual Result<void> transfer_from(
        Address const &spender, Address const &owner,
        Address const &recipient, uint256_t const &amount) = 0;

    virtual Result<void> approve(
        Address const &owner, Address const &spender,
        uint256_t const &amount) = 0;
};

class MintableToken : public FungibleToken
{
public:
    // only the configured minter may call this
    virtual Result<void> mint(
        Address const &caller, Address const &recipient,
        uint256_t const &amount) = 0;
};

HARVEST_NAMESPACE_END
