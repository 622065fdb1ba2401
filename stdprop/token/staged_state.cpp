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
#include <stdprop/core/int.hpp>
#include <stdprop/token/staged_state.hpp>
#include <stdprop/token/token_delta.hpp>

STDPROP_NAMESPACE_BEGIN

uint256_t StagedState::balance_of(Address const &address) const
{
    auto const it = delta_.balances.find(address);
    if (it != delta_.balances.end()) {
        return it->second.second;
    }
    return state_.balance_of(address);
}

uint256_t
StagedState::allowance_of(Address const &owner, Address const &spender) const
{
    auto const it = delta_.allowances.find(AllowanceKey{owner, spender});
    if (it != delta_.allowances.end()) {
        return it->second.second;
    }
    return state_.allowance_of(owner, spender);
}

uint256_t StagedState::total_supply() const
{
    if (delta_.total_supply.has_value()) {
        return delta_.total_supply->second;
    }
    return state_.total_supply();
}

void StagedState::set_balance(Address const &address, uint256_t const &value)
{
    auto const it = delta_.balances.find(address);
    if (it != delta_.balances.end()) {
        it->second.second = value;
    }
    else {
        delta_.balances.emplace(
            address, Delta<uint256_t>{state_.balance_of(address), value});
    }
}

void StagedState::set_allowance(
    Address const &owner, Address const &spender, uint256_t const &value)
{
    AllowanceKey const key{owner, spender};
    auto const it = delta_.allowances.find(key);
    if (it != delta_.allowances.end()) {
        it->second.second = value;
    }
    else {
        delta_.allowances.emplace(
            key, Delta<uint256_t>{state_.allowance_of(owner, spender), value});
    }
}

void StagedState::set_total_supply(uint256_t const &value)
{
    if (delta_.total_supply.has_value()) {
        delta_.total_supply->second = value;
    }
    else {
        delta_.total_supply.emplace(state_.total_supply(), value);
    }
}

STDPROP_NAMESPACE_END
