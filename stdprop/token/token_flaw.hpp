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

#include <stdprop/core/config.hpp>

#include <cstdint>
#include <map>
#include <set>
#include <string>
#include <string_view>

STDPROP_NAMESPACE_BEGIN

// Defects that can be injected into the reference token. Each one breaks a
// single rule of the standard and leaves the rest of the behavior intact.
enum class TokenFlaw : uint8_t
{
    ZeroAddressBurns,
    ReturnFalseOnFailure,
    MissingReturnValue,
    WrappingCredit,
    SelfTransferCredits,
    TransferFee,
    TransferResetsAllowance,
    AllowanceUnchecked,
    AllowanceNotConsumed,
    ApproveAccumulates,
    ApproveMirrorsAllowance,
    ZeroAmountReverts,
    BalanceOfNullReverts,
    TotalSupplyOffByOne,
    MintSkipsSupply,
    SelfTransferFromPaysSpender,
};

using FlawSet = std::set<TokenFlaw>;

std::string_view flaw_name(TokenFlaw);
std::string_view flaw_description(TokenFlaw);

// snake_case name -> flaw, for command line parsing
std::map<std::string, TokenFlaw> const &flaw_name_map();

STDPROP_NAMESPACE_END
