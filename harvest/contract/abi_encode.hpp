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
#include <harvest/core/byte_string.hpp>
#include <harvest/core/bytes.hpp>
#include <harvest/core/config.hpp>
#include <harvest/contract/big_endian.hpp>

#include <cstring>

HARVEST_NAMESPACE_BEGIN

// Solidity ABI encoding of the static types used in event topics and data.
//
// https://docs.soliditylang.org/en/latest/abi-spec.html#types

inline bytes32_t abi_encode_address(Address const &address)
{
    bytes32_t output{};
    std::memcpy(&output.bytes[12], address.bytes, sizeof(Address));
    return output;
}

template <BigEndianType I>
bytes32_t abi_encode_int(I const &i)
{
    static_assert(sizeof(I) <= sizeof(bytes32_t));

    constexpr size_t offset = sizeof(bytes32_t) - sizeof(I);
    bytes32_t output{};
    std::memcpy(&output.bytes[offset], &i, sizeof(I));
    return output;
}

HARVEST_NAMESPACE_END
