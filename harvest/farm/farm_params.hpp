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
#include <harvest/farm/constants.hpp>

#include <nlohmann/json_fwd.hpp>

#include <cstdint>
#include <filesystem>
#include <iterator>
#include <vector>

HARVEST_NAMESPACE_BEGIN

// Immutable emission parameters of a farm.
struct FarmParams
{
    uint64_t genesis_tick{0};
    uint64_t epoch_length{0};
    // per tick emission of epoch i, non increasing
    std::vector<uint256_t> rates{};
    // operator fee is pool_reward / divisor, 0 disables the fee
    std::vector<uint64_t> dev_fee_divisors{
        std::begin(DEFAULT_DEV_FEE_DIVISORS),
        std::end(DEFAULT_DEV_FEE_DIVISORS)};
    Address owner{};
    Address dev_address{};
};

Result<void> validate(FarmParams const &);

// Accepts integers as JSON numbers or as decimal / 0x prefixed strings.
// Missing dev_fee_divisors keeps the default table.
Result<FarmParams> parse_farm_params(nlohmann::json const &);

Result<FarmParams> load_farm_params(std::filesystem::path const &);

nlohmann::json to_json(FarmParams const &);

HARVEST_NAMESPACE_END
