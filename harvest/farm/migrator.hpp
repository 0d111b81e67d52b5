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
#include <harvest/core/result.hpp>

HARVEST_NAMESPACE_BEGIN

class FungibleToken;

// Moves a pool's staked asset to a replacement asset. The farm approves the
// migrator for its whole balance of the old asset before calling migrate();
// the migrator must leave the farm holding exactly the same balance of the
// returned asset.
class Migrator
{
public:
    virtual ~Migrator() = default;

    virtual Address const &address() const noexcept = 0;

    virtual Result<Address> migrate(FungibleToken &old_asset) = 0;
};

HARVEST_NAMESPACE_END
