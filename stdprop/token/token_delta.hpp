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

#include <map>
#include <optional>
#include <utility>

STDPROP_NAMESPACE_BEGIN

template <class T>
using Delta = std::pair<T const, T>;

// (owner, spender)
using AllowanceKey = std::pair<Address, Address>;

using BalanceDeltas = std::map<Address, Delta<uint256_t>>;
using AllowanceDeltas = std::map<AllowanceKey, Delta<uint256_t>>;

// Effects of one call. Each entry holds the value observed before the call
// and the value to install.
struct TokenDelta
{
    BalanceDeltas balances{};
    AllowanceDeltas allowances{};
    std::optional<Delta<uint256_t>> total_supply{};
};

STDPROP_NAMESPACE_END
