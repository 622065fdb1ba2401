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

#include <stdprop/core/address.hpp>
#include <stdprop/core/arith/checked.hpp>
#include <stdprop/core/assert.h>
#include <stdprop/core/int.hpp>
#include <stdprop/core/likely.h>
#include <stdprop/core/result.hpp>
#include <stdprop/token/account_state.hpp>
#include <stdprop/token/token_delta.hpp>
#include <stdprop/token/token_error.hpp>

#include <boost/outcome/success_failure.hpp>

#include <map>
#include <utility>

STDPROP_ANONYMOUS_NAMESPACE_BEGIN

template <class Key>
uint256_t read(std::map<Key, uint256_t> const &m, Key const &key)
{
    auto const it = m.find(key);
    return it == m.end() ? uint256_t{0} : it->second;
}

template <class Key>
void write(std::map<Key, uint256_t> &m, Key const &key, uint256_t const &value)
{
    if (value == 0) {
        m.erase(key);
    }
    else {
        m.insert_or_assign(key, value);
    }
}

template <class Key>
std::map<Key, Delta<uint256_t>> changes(
    std::map<Key, uint256_t> const &pre, std::map<Key, uint256_t> const &post)
{
    std::map<Key, Delta<uint256_t>> result;
    for (auto const &[key, value] : pre) {
        auto const after = read(post, key);
        if (after != value) {
            result.emplace(key, Delta<uint256_t>{value, after});
        }
    }
    for (auto const &[key, value] : post) {
        if (!pre.contains(key)) {
            result.emplace(key, Delta<uint256_t>{uint256_t{0}, value});
        }
    }
    return result;
}

STDPROP_ANONYMOUS_NAMESPACE_END

STDPROP_NAMESPACE_BEGIN

uint256_t AccountState::balance_of(Address const &address) const
{
    return read(balances_, address);
}

uint256_t
AccountState::allowance_of(Address const &owner, Address const &spender) const
{
    return read(allowances_, AllowanceKey{owner, spender});
}

std::pair<uint256_t, bool> AccountState::sum_of_balances() const
{
    uint256_t sum{0};
    bool overflowed = false;
    for (auto const &[_, balance] : balances_) {
        auto const [next, carry] = add(sum, balance);
        sum = next;
        overflowed |= carry;
    }
    return {sum, overflowed};
}

Result<void> AccountState::commit(TokenDelta const &delta)
{
    for (auto const &[address, balance] : delta.balances) {
        STDPROP_ASSERT(balance_of(address) == balance.first);
        if (STDPROP_UNLIKELY(is_null(address) && balance.second != 0)) {
            return TokenError::NullAddressCredit;
        }
    }
    for (auto const &[key, allowance] : delta.allowances) {
        STDPROP_ASSERT(read(allowances_, key) == allowance.first);
    }
    if (delta.total_supply.has_value()) {
        STDPROP_ASSERT(total_supply_ == delta.total_supply->first);
    }

    for (auto const &[address, balance] : delta.balances) {
        write(balances_, address, balance.second);
    }
    for (auto const &[key, allowance] : delta.allowances) {
        write(allowances_, key, allowance.second);
    }
    if (delta.total_supply.has_value()) {
        total_supply_ = delta.total_supply->second;
    }
    return outcome::success();
}

BalanceDeltas balance_changes(AccountState const &pre, AccountState const &post)
{
    return changes(pre.balances(), post.balances());
}

AllowanceDeltas
allowance_changes(AccountState const &pre, AccountState const &post)
{
    return changes(pre.allowances(), post.allowances());
}

STDPROP_NAMESPACE_END
