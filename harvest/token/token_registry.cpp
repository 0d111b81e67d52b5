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

#include <harvest/token/token_registry.hpp>

HARVEST_NAMESPACE_BEGIN

bool TokenRegistry::add(FungibleToken &token)
{
    return tokens_.try_emplace(token.address(), &token).second;
}

FungibleToken *TokenRegistry::find(Address const &address) const noexcept
{
    auto const it = tokens_.find(address);
    return it == tokens_.end() ? nullptr : it->second;
}

bool TokenRegistry::contains(Address const &address) const noexcept
{
    return tokens_.contains(address);
}

size_t TokenRegistry::size() const noexcept
{
    return tokens_.size();
}

HARVEST_NAMESPACE_END
