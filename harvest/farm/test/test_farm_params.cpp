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
#include <harvest/farm/farm_error.hpp>
#include <harvest/farm/farm_params.hpp>

#include "farm_fixture.hpp"

#include <gtest/gtest.h>
#include <intx/intx.hpp>
#include <nlohmann/json.hpp>

#include <filesystem>
#include <fstream>
#include <string>
#include <unistd.h>

using namespace harvest;
using namespace harvest::test;

namespace
{
    nlohmann::json valid_json()
    {
        return nlohmann::json::parse(R"({
            "genesis_tick": 7,
            "epoch_length": "0x64",
            "rates": [80, "80", "20", 10],
            "dev_fee_divisors": [10, 10, 20],
            "owner": "0x000000000000000000000000000000000000a001",
            "dev_address": "0x000000000000000000000000000000000000de01"
        })");
    }

    void expect_invalid(nlohmann::json const &json)
    {
        auto const res = parse_farm_params(json);
        ASSERT_TRUE(res.has_error());
        EXPECT_EQ(res.assume_error(), FarmError::InvalidConfig);
    }
}

TEST(FarmParams, parse)
{
    auto const res = parse_farm_params(valid_json());
    ASSERT_FALSE(res.has_error());

    auto const &params = res.value();
    EXPECT_EQ(params.genesis_tick, 7);
    EXPECT_EQ(params.epoch_length, 100);
    ASSERT_EQ(params.rates.size(), 4u);
    EXPECT_EQ(params.rates[0], 80);
    EXPECT_EQ(params.rates[2], 20);
    EXPECT_EQ(params.rates[3], 10);
    EXPECT_EQ(params.dev_fee_divisors, (std::vector<uint64_t>{10, 10, 20}));
    EXPECT_EQ(params.owner, OWNER);
    EXPECT_EQ(params.dev_address, DEV);
}

TEST(FarmParams, large_rates)
{
    auto json = valid_json();
    json["rates"] = {"100000000000000000000000000000", "1"};
    auto const res = parse_farm_params(json);
    ASSERT_FALSE(res.has_error());
    EXPECT_EQ(
        res.value().rates[0],
        intx::from_string<uint256_t>("100000000000000000000000000000"));
}

TEST(FarmParams, default_fee_divisors)
{
    auto json = valid_json();
    json.erase("dev_fee_divisors");
    auto const res = parse_farm_params(json);
    ASSERT_FALSE(res.has_error());
    EXPECT_EQ(
        res.value().dev_fee_divisors, (std::vector<uint64_t>{10, 10, 20}));
}

TEST(FarmParams, invalid)
{
    {
        auto json = valid_json();
        json["epoch_length"] = 0;
        expect_invalid(json);
    }
    {
        auto json = valid_json();
        json["rates"] = nlohmann::json::array();
        expect_invalid(json);
    }
    {
        auto json = valid_json();
        json["rates"] = {10, 20};
        expect_invalid(json);
    }
    {
        auto json = valid_json();
        json["rates"] = {10, 0};
        expect_invalid(json);
    }
    {
        auto json = valid_json();
        json["rates"] = {10, -1};
        expect_invalid(json);
    }
    {
        auto json = valid_json();
        json["rates"] = {"ten"};
        expect_invalid(json);
    }
    {
        auto json = valid_json();
        json["genesis_tick"] = "0x10000000000000000";
        expect_invalid(json);
    }
    {
        auto json = valid_json();
        json["owner"] = "0x1234";
        expect_invalid(json);
    }
    {
        auto json = valid_json();
        json["dev_address"] = "0x0000000000000000000000000000000000000000";
        expect_invalid(json);
    }
    {
        auto json = valid_json();
        json.erase("owner");
        expect_invalid(json);
    }
}

TEST(FarmParams, json_round_trip)
{
    auto const params = make_params();
    auto const res = parse_farm_params(to_json(params));
    ASSERT_FALSE(res.has_error());
    EXPECT_EQ(res.value().rates, params.rates);
    EXPECT_EQ(res.value().owner, params.owner);
    EXPECT_EQ(res.value().dev_address, params.dev_address);
    EXPECT_EQ(res.value().epoch_length, params.epoch_length);
}

TEST(FarmParams, load_from_file)
{
    auto const path = std::filesystem::temp_directory_path() /
                      ("harvest_params_" + std::to_string(getpid()) + ".json");
    {
        std::ofstream out{path};
        out << valid_json().dump();
    }
    auto const res = load_farm_params(path);
    std::filesystem::remove(path);
    ASSERT_FALSE(res.has_error());
    EXPECT_EQ(res.value().genesis_tick, 7);

    auto const missing = load_farm_params(path);
    ASSERT_TRUE(missing.has_error());
    EXPECT_EQ(missing.assume_error(), FarmError::InvalidConfig);
}
