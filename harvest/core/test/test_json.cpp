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

#include <gtest/gtest.h>
#include <intx/intx.hpp>
#include <nlohmann/json.hpp>

#include <cstdint>
#include <limits>
#include <stdexcept>

using namespace harvest;

TEST(Json, uint256_from_number_and_string)
{
    EXPECT_EQ(json_to_uint256(nlohmann::json(42)), 42);
    EXPECT_EQ(json_to_uint256(nlohmann::json("1000000")), 1'000'000);
    EXPECT_EQ(
        json_to_uint256(nlohmann::json(
            "115792089237316195423570985008687907853269984665640564039457584007913129639935")),
        std::numeric_limits<uint256_t>::max());
    EXPECT_EQ(json_to_uint256(nlohmann::json("0xff")), 255);
}

TEST(Json, uint256_rejects_bad_input)
{
    EXPECT_THROW(json_to_uint256(nlohmann::json(-1)), std::invalid_argument);
    EXPECT_THROW(json_to_uint256(nlohmann::json(1.5)), std::invalid_argument);
    EXPECT_THROW(json_to_uint256(nlohmann::json("12a")), std::invalid_argument);
    EXPECT_THROW(json_to_uint256(nlohmann::json(true)), std::invalid_argument);
}

TEST(Json, uint64_range)
{
    EXPECT_EQ(
        json_to_uint64(nlohmann::json("18446744073709551615")),
        std::numeric_limits<uint64_t>::max());
    EXPECT_THROW(
        json_to_uint64(nlohmann::json("18446744073709551616")),
        std::out_of_range);
}

TEST(Json, address)
{
    constexpr auto expected =
        0x000000000000000000000000000000000000a11c_address;
    auto const parsed = json_to_address(
        nlohmann::json("0x000000000000000000000000000000000000a11c"));
    EXPECT_EQ(parsed, expected);
    EXPECT_EQ(to_hex(parsed), "0x000000000000000000000000000000000000a11c");

    EXPECT_THROW(
        json_to_address(nlohmann::json("0xa11c")), std::invalid_argument);
    EXPECT_THROW(
        json_to_address(nlohmann::json("0xzz00000000000000000000000000000000000000")),
        std::invalid_argument);
    EXPECT_THROW(json_to_address(nlohmann::json(7)), nlohmann::json::exception);
}
