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

#include <harvest/contract/abi_encode.hpp>
#include <harvest/contract/big_endian.hpp>
#include <harvest/core/address.hpp>
#include <harvest/core/byte_string.hpp>
#include <harvest/core/bytes.hpp>
#include <harvest/core/config.hpp>
#include <harvest/state/state.hpp>

HARVEST_NAMESPACE_BEGIN

// Accumulates one solidity compatible log. The event signature is the first
// topic, indexed arguments follow it, the other arguments are ABI words
// appended to the data.
class EventBuilder
{
    Log log_;

    void append_word(bytes32_t const &word)
    {
        log_.data += byte_string_view{word.bytes, sizeof(bytes32_t)};
    }

public:
    EventBuilder(Address const &emitter, bytes32_t const &signature)
        : log_{.address = emitter, .topics = {signature}, .data = {}}
    {
    }

    EventBuilder &topic(Address const &address)
    {
        log_.topics.push_back(abi_encode_address(address));
        return *this;
    }

    template <BigEndianType I>
    EventBuilder &topic(I const &value)
    {
        log_.topics.push_back(abi_encode_int(value));
        return *this;
    }

    EventBuilder &data(Address const &address)
    {
        append_word(abi_encode_address(address));
        return *this;
    }

    template <BigEndianType I>
    EventBuilder &data(I const &value)
    {
        append_word(abi_encode_int(value));
        return *this;
    }

    Log const &log() const noexcept
    {
        return log_;
    }

    // appends the log to the current version of the state
    void emit(State &state) const
    {
        state.store_log(log_);
    }
};

HARVEST_NAMESPACE_END
