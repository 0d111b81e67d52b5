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
#include <harvest/core/int.hpp>
#include <harvest/core/json.hpp>

#include <evmc/evmc.hpp>
#include <evmc/hex.hpp>
#include <intx/intx.hpp>
#include <nlohmann/json.hpp>

#include <algorithm>
#include <cstdint>
#include <limits>
#include <stdexcept>
#include <string>

HARVEST_NAMESPACE_BEGIN

uint256_t json_to_uint256(nlohmann::json const &value)
{
    if (value.is_number_unsigned()) {
        return uint256_t{value.get<uint64_t>()};
    }
    if (value.is_string()) {
        return intx::from_string<uint256_t>(value.get<std::string>());
    }
    throw std::invalid_argument{"expected unsigned integer"};
}

uint64_t json_to_uint64(nlohmann::json const &value)
{
    auto const v = json_to_uint256(value);
    if (v > std::numeric_limits<uint64_t>::max()) {
        throw std::out_of_range{"value does not fit in 64 bits"};
    }
    return static_cast<uint64_t>(v);
}

Address json_to_address(nlohmann::json const &value)
{
    auto const bytes = evmc::from_hex(value.get<std::string>());
    if (!bytes.has_value() || bytes.value().size() != sizeof(Address)) {
        throw std::invalid_argument{"expected 20 byte hex address"};
    }
    Address address{};
    std::copy_n(bytes.value().begin(), sizeof(Address), address.bytes);
    return address;
}

std::string to_hex(Address const &address)
{
    return "0x" + evmc::hex({address.bytes, sizeof(Address)});
}

HARVEST_NAMESPACE_END
