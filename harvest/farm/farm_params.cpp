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
#include <harvest/core/fmt/int_fmt.hpp>
#include <harvest/core/int.hpp>
#include <harvest/core/json.hpp>
#include <harvest/core/likely.h>
#include <harvest/core/result.hpp>
#include <harvest/farm/farm_error.hpp>
#include <harvest/farm/farm_params.hpp>

#include <intx/intx.hpp>
#include <nlohmann/json.hpp>
#include <quill/Quill.h>

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>

HARVEST_NAMESPACE_BEGIN

Result<void> validate(FarmParams const &params)
{
    if (HARVEST_UNLIKELY(params.epoch_length == 0)) {
        LOG_ERROR("FarmParams: epoch_length must be positive");
        return FarmError::InvalidConfig;
    }
    if (HARVEST_UNLIKELY(params.rates.empty())) {
        LOG_ERROR("FarmParams: rate table is empty");
        return FarmError::InvalidConfig;
    }
    for (size_t i = 1; i < params.rates.size(); ++i) {
        if (HARVEST_UNLIKELY(params.rates[i] > params.rates[i - 1])) {
            LOG_ERROR(
                "FarmParams: rate of epoch {} ({}) exceeds rate of epoch {} "
                "({})",
                i,
                params.rates[i],
                i - 1,
                params.rates[i - 1]);
            return FarmError::InvalidConfig;
        }
    }
    // the last rate applies forever
    if (HARVEST_UNLIKELY(params.rates.back() == 0)) {
        LOG_ERROR("FarmParams: final rate must be positive");
        return FarmError::InvalidConfig;
    }
    if (HARVEST_UNLIKELY(params.owner == NULL_ADDRESS)) {
        LOG_ERROR("FarmParams: owner is not set");
        return FarmError::InvalidConfig;
    }
    if (HARVEST_UNLIKELY(params.dev_address == NULL_ADDRESS)) {
        LOG_ERROR("FarmParams: dev_address is not set");
        return FarmError::InvalidConfig;
    }
    return outcome::success();
}

Result<FarmParams> parse_farm_params(nlohmann::json const &json)
{
    FarmParams params{};
    try {
        params.genesis_tick = json_to_uint64(json.at("genesis_tick"));
        params.epoch_length = json_to_uint64(json.at("epoch_length"));
        params.rates.clear();
        for (auto const &rate : json.at("rates")) {
            params.rates.push_back(json_to_uint256(rate));
        }
        if (json.contains("dev_fee_divisors")) {
            params.dev_fee_divisors.clear();
            for (auto const &divisor : json["dev_fee_divisors"]) {
                params.dev_fee_divisors.push_back(json_to_uint64(divisor));
            }
        }
        params.owner = json_to_address(json.at("owner"));
        params.dev_address = json_to_address(json.at("dev_address"));
    }
    catch (nlohmann::json::exception const &e) {
        LOG_ERROR("FarmParams: malformed json: {}", e.what());
        return FarmError::InvalidConfig;
    }
    catch (std::invalid_argument const &e) {
        LOG_ERROR("FarmParams: invalid value: {}", e.what());
        return FarmError::InvalidConfig;
    }
    catch (std::out_of_range const &e) {
        LOG_ERROR("FarmParams: value out of range: {}", e.what());
        return FarmError::InvalidConfig;
    }
    BOOST_OUTCOME_TRY(validate(params));
    return params;
}

Result<FarmParams> load_farm_params(std::filesystem::path const &path)
{
    std::ifstream ifile(path.c_str());
    if (HARVEST_UNLIKELY(!ifile)) {
        LOG_ERROR("FarmParams: cannot open {}", path.string());
        return FarmError::InvalidConfig;
    }
    auto const json = nlohmann::json::parse(ifile, nullptr, false);
    if (HARVEST_UNLIKELY(json.is_discarded())) {
        LOG_ERROR("FarmParams: {} is not valid json", path.string());
        return FarmError::InvalidConfig;
    }
    return parse_farm_params(json);
}

nlohmann::json to_json(FarmParams const &params)
{
    nlohmann::json json;
    json["genesis_tick"] = params.genesis_tick;
    json["epoch_length"] = params.epoch_length;
    json["rates"] = nlohmann::json::array();
    for (auto const &rate : params.rates) {
        json["rates"].push_back(intx::to_string(rate, 10));
    }
    json["dev_fee_divisors"] = params.dev_fee_divisors;
    json["owner"] = to_hex(params.owner);
    json["dev_address"] = to_hex(params.dev_address);
    return json;
}

HARVEST_NAMESPACE_END
