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

#include <stdprop/core/address.hpp>
#include <stdprop/core/config.hpp>
#include <stdprop/core/int.hpp>
#include <stdprop/core/result.hpp>
#include <stdprop/token/token_delta.hpp>

#include <map>
#include <utility>

STDPROP_NAMESPACE_BEGIN

// Ledger of a single token: balances, allowances and total supply. Reads
// are total and return zero for unknown keys. The only mutator is commit(),
// which applies a whole TokenDelta or nothing.
//
// Zero entries are never stored, so two states compare equal iff every read
// agrees on them.
class AccountState
{
    std::map<Address, uint256_t> balances_{};
    std::map<AllowanceKey, uint256_t> allowances_{};
    uint256_t total_supply_{0};

public:
    uint256_t balance_of(Address const &) const;
    uint256_t allowance_of(Address const &owner, Address const &spender) const;

    uint256_t const &total_supply() const noexcept
    {
        return total_supply_;
    }

    std::map<Address, uint256_t> const &balances() const noexcept
    {
        return balances_;
    }

    std::map<AllowanceKey, uint256_t> const &allowances() const noexcept
    {
        return allowances_;
    }

    // Sum of all balances, with a flag set if the sum exceeds 2^256 - 1
    std::pair<uint256_t, bool> sum_of_balances() const;

    Result<void> commit(TokenDelta const &);

    bool operator==(AccountState const &) const = default;
};

// Keys whose value differs between the two states, as (pre, post) pairs
BalanceDeltas
balance_changes(AccountState const &pre, AccountState const &post);
AllowanceDeltas
allowance_changes(AccountState const &pre, AccountState const &post);

STDPROP_NAMESPACE_END
