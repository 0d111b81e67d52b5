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
#include <harvest/token/token.hpp>

#include <ankerl/unordered_dense.h>

#include <cstddef>
#include <cstdint>

HARVEST_NAMESPACE_BEGIN

// Resolves asset addresses to the live token objects. Tokens are owned by
// the caller and must outlive the registry.
class TokenRegistry
{
    struct AddressHash
    {
        using is_avalanching = void;

        uint64_t operator()(Address const &address) const noexcept
        {
            return ankerl::unordered_dense::detail::wyhash::hash(
                address.bytes, sizeof(Address));
        }
    };

    ankerl::unordered_dense::map<Address, FungibleToken *, AddressHash>
        tokens_{};

public:
    // false if a token is already registered at the same address
    bool add(FungibleToken &);

    FungibleToken *find(Address const &) const noexcept;

    bool contains(Address const &) const noexcept;

    size_t size() const noexcept;
};

HARVEST_NAMESPACE_END
