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

#include <nlohmann/json_fwd.hpp>

#include <cstdint>
#include <string>

HARVEST_NAMESPACE_BEGIN

// Integers are accepted as unsigned JSON numbers or as decimal / 0x prefixed
// strings. Throw std::invalid_argument or std::out_of_range on bad input,
// nlohmann::json::exception on a type mismatch.
uint256_t json_to_uint256(nlohmann::json const &);
uint64_t json_to_uint64(nlohmann::json const &);
Address json_to_address(nlohmann::json const &);

std::string to_hex(Address const &);

HARVEST_NAMESPACE_END
