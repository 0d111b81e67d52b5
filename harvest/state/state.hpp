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
#include <harvest/core/int.hpp>

#include <ankerl/unordered_dense.h>

#include <cstddef>
#include <cstdint>
#include <vector>

HARVEST_NAMESPACE_BEGIN

struct Log
{
    Address address{};
    std::vector<bytes32_t> topics{};
    byte_string data{};

    bool operator==(Log const &) const = default;
};

// In-memory ledger state shared by every contract of a farm: storage slots,
// token balances, allowances and emitted logs.
//
// push() opens a new version. Writes always land in the innermost version.
// pop_accept() folds it into the enclosing one, pop_reject() drops it along
// with every log emitted since the matching push().
class State
{
public:
    struct StorageKey
    {
        Address address;
        bytes32_t key;

        bool operator==(StorageKey const &) const = default;
    };

    struct BalanceKey
    {
        Address token;
        Address holder;

        bool operator==(BalanceKey const &) const = default;
    };

    struct AllowanceKey
    {
        Address token;
        Address owner;
        Address spender;

        bool operator==(AllowanceKey const &) const = default;
    };

    static_assert(sizeof(StorageKey) == 52);
    static_assert(sizeof(BalanceKey) == 40);
    static_assert(sizeof(AllowanceKey) == 60);

private:
    template <class Key>
    struct KeyHash
    {
        using is_avalanching = void;

        uint64_t operator()(Key const &key) const noexcept
        {
            return ankerl::unordered_dense::detail::wyhash::hash(
                &key, sizeof(Key));
        }
    };

    template <class Key, class T>
    using Map = ankerl::unordered_dense::segmented_map<Key, T, KeyHash<Key>>;

    struct Version
    {
        Map<StorageKey, bytes32_t> storage{};
        Map<BalanceKey, uint256_t> balances{};
        Map<AllowanceKey, uint256_t> allowances{};
        size_t log_count{0};
    };

    Version original_{};
    std::vector<Version> versions_{};
    std::vector<Log> logs_{};

    template <class Key, class T>
    T read(Map<Key, T> Version::*, Key const &) const;

    template <class Key, class T>
    void write(Map<Key, T> Version::*, Key const &, T const &);

    template <class Key, class T>
    void merge(Map<Key, T> Version::*, Map<Key, T> const &);

public:
    State() = default;
    State(State const &) = delete;
    State &operator=(State const &) = delete;

    ////////////////
    //  Storage  //
    ////////////////
    bytes32_t get_storage(Address const &, bytes32_t const &key) const;
    void set_storage(Address const &, bytes32_t const &key, bytes32_t const &);

    ////////////////
    //  Balances  //
    ////////////////
    uint256_t get_balance(Address const &token, Address const &holder) const;
    void set_balance(
        Address const &token, Address const &holder, uint256_t const &);
    void add_to_balance(
        Address const &token, Address const &holder, uint256_t const &);
    void subtract_from_balance(
        Address const &token, Address const &holder, uint256_t const &);

    uint256_t get_allowance(
        Address const &token, Address const &owner,
        Address const &spender) const;
    void set_allowance(
        Address const &token, Address const &owner, Address const &spender,
        uint256_t const &);

    ////////////
    //  Logs  //
    ////////////
    void store_log(Log const &);
    std::vector<Log> const &logs() const noexcept;

    ////////////////
    //  Versions  //
    ////////////////
    void push();
    void pop_accept();
    void pop_reject();
    size_t version() const noexcept;
};

HARVEST_NAMESPACE_END
