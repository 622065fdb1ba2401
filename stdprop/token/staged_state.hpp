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
#include <stdprop/token/account_state.hpp>
#include <stdprop/token/token_delta.hpp>

STDPROP_NAMESPACE_BEGIN

// Working copy over a committed AccountState. Reads see staged writes first;
// writes are recorded into a TokenDelta together with the committed value.
class StagedState
{
    AccountState const &state_;
    TokenDelta delta_{};

public:
    explicit StagedState(AccountState const &state)
        : state_{state}
    {
    }

    uint256_t balance_of(Address const &) const;
    uint256_t allowance_of(Address const &owner, Address const &spender) const;
    uint256_t total_supply() const;

    void set_balance(Address const &, uint256_t const &);
    void set_allowance(
        Address const &owner, Address const &spender, uint256_t const &);
    void set_total_supply(uint256_t const &);

    TokenDelta const &delta() const noexcept
    {
        return delta_;
    }
};

STDPROP_NAMESPACE_END
