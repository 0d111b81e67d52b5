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

#include <quill/Quill.h>
#include <quill/bundled/fmt/format.h>

#include <iterator>
#include <string_view>
#include <type_traits>

template <>
struct quill::copy_loggable<harvest::Address> : std::true_type
{
};

template <>
struct fmt::formatter<harvest::Address> : fmt::formatter<std::string_view>
{
    template <typename FormatContext>
    auto format(harvest::Address const &value, FormatContext &ctx) const
    {
        fmt::memory_buffer mb;
        std::back_insert_iterator i{mb};
        i = fmt::format_to(i, "0x");
        for (auto const byte : value.bytes) {
            i = fmt::format_to(i, "{:02x}", byte);
        }
        std::string_view const view{mb.data(), mb.size()};
        return fmt::formatter<std::string_view>::format(view, ctx);
    }
};
