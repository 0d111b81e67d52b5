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

#include <harvest/core/assert.h>
#include <harvest/state/state.hpp>

#include <utility>

HARVEST_NAMESPACE_BEGIN

template <class Key, class T>
T State::read(Map<Key, T> Version::*const member, Key const &key) const
{
    for (auto it = versions_.rbegin(); it != versions_.rend(); ++it) {
        auto const &map = (*it).*member;
        auto const found = map.find(key);
        if (found != map.end()) {
            return found->second;
        }
    }
    auto const &map = original_.*member;
    auto const found = map.find(key);
    return found == map.end() ? T{} : found->second;
}

template <class Key, class T>
void State::write(
    Map<Key, T> Version::*const member, Key const &key, T const &value)
{
    if (versions_.empty()) {
        auto &map = original_.*member;
        if (value == T{}) {
            map.erase(key);
        }
        else {
            map.insert_or_assign(key, value);
        }
        return;
    }
    // zero values are kept in an open version so they shadow older writes
    (versions_.back().*member).insert_or_assign(key, value);
}

template <class Key, class T>
void State::merge(Map<Key, T> Version::*const member, Map<Key, T> const &from)
{
    for (auto const &[key, value] : from) {
        write(member, key, value);
    }
}

bytes32_t
State::get_storage(Address const &address, bytes32_t const &key) const
{
    return read(&Version::storage, StorageKey{address, key});
}

void State::set_storage(
    Address const &address, bytes32_t const &key, bytes32_t const &value)
{
    write(&Version::storage, StorageKey{address, key}, value);
}

uint256_t
State::get_balance(Address const &token, Address const &holder) const
{
    return read(&Version::balances, BalanceKey{token, holder});
}

void State::set_balance(
    Address const &token, Address const &holder, uint256_t const &amount)
{
    write(&Version::balances, BalanceKey{token, holder}, amount);
}

void State::add_to_balance(
    Address const &token, Address const &holder, uint256_t const &delta)
{
    auto const balance = get_balance(token, holder);
    HARVEST_ASSERT(balance + delta >= balance);
    set_balance(token, holder, balance + delta);
}

void State::subtract_from_balance(
    Address const &token, Address const &holder, uint256_t const &delta)
{
    auto const balance = get_balance(token, holder);
    HARVEST_ASSERT(balance >= delta);
    set_balance(token, holder, balance - delta);
}

uint256_t State::get_allowance(
    Address const &token, Address const &owner, Address const &spender) const
{
    return read(&Version::allowances, AllowanceKey{token, owner, spender});
}

void State::set_allowance(
    Address const &token, Address const &owner, Address const &spender,
    uint256_t const &amount)
{
    write(&Version::allowances, AllowanceKey{token, owner, spender}, amount);
}

void State::store_log(Log const &log)
{
    logs_.push_back(log);
}

std::vector<Log> const &State::logs() const noexcept
{
    return logs_;
}

void State::push()
{
    Version version{};
    version.log_count = logs_.size();
    versions_.push_back(std::move(version));
}

void State::pop_accept()
{
    HARVEST_ASSERT(!versions_.empty());
    Version const top = std::move(versions_.back());
    versions_.pop_back();
    merge(&Version::storage, top.storage);
    merge(&Version::balances, top.balances);
    merge(&Version::allowances, top.allowances);
}

void State::pop_reject()
{
    HARVEST_ASSERT(!versions_.empty());
    logs_.resize(versions_.back().log_count);
    versions_.pop_back();
}

size_t State::version() const noexcept
{
    return versions_.size();
}

HARVEST_NAMESPACE_END
