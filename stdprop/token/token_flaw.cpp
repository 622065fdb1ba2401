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

#include <stdprop/core/assert.h>
#include <stdprop/token/token_flaw.hpp>

#include <magic_enum.hpp>

#include <cctype>
#include <map>
#include <string>
#include <string_view>

STDPROP_ANONYMOUS_NAMESPACE_BEGIN

std::string to_snake_case(std::string_view const name)
{
    std::string out;
    out.reserve(name.size() + 8);
    for (auto const c : name) {
        if (std::isupper(static_cast<unsigned char>(c))) {
            if (!out.empty()) {
                out.push_back('_');
            }
            out.push_back(
                static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
        }
        else {
            out.push_back(c);
        }
    }
    return out;
}

STDPROP_ANONYMOUS_NAMESPACE_END

STDPROP_NAMESPACE_BEGIN

std::string_view flaw_name(TokenFlaw const flaw)
{
    return magic_enum::enum_name(flaw);
}

std::string_view flaw_description(TokenFlaw const flaw)
{
    switch (flaw) {
    case TokenFlaw::ZeroAddressBurns:
        return "transfer to the null address burns instead of reverting";
    case TokenFlaw::ReturnFalseOnFailure:
        return "insufficient balance or allowance returns false instead of "
               "reverting";
    case TokenFlaw::MissingReturnValue:
        return "mutating calls complete with empty return data";
    case TokenFlaw::WrappingCredit:
        return "receiver credit wraps modulo 2^256";
    case TokenFlaw::SelfTransferCredits:
        return "self-transfer credits from a stale balance read";
    case TokenFlaw::TransferFee:
        return "one percent of every transfer is burned";
    case TokenFlaw::TransferResetsAllowance:
        return "transfer clears the sender's allowance to the receiver";
    case TokenFlaw::AllowanceUnchecked:
        return "transferFrom does not check the allowance";
    case TokenFlaw::AllowanceNotConsumed:
        return "transferFrom does not decrement the allowance";
    case TokenFlaw::ApproveAccumulates:
        return "approve adds to the existing allowance";
    case TokenFlaw::ApproveMirrorsAllowance:
        return "approve also writes the reverse (spender, owner) allowance";
    case TokenFlaw::ZeroAmountReverts:
        return "zero amount transfers revert";
    case TokenFlaw::BalanceOfNullReverts:
        return "balanceOf reverts for the null address";
    case TokenFlaw::TotalSupplyOffByOne:
        return "totalSupply reports one more than the supply";
    case TokenFlaw::MintSkipsSupply:
        return "mint credits the recipient without raising the supply";
    case TokenFlaw::SelfTransferFromPaysSpender:
        return "transferFrom to the source also credits the spender with the "
               "amount";
    }
    STDPROP_ABORT("unknown token flaw");
}

std::map<std::string, TokenFlaw> const &flaw_name_map()
{
    static std::map<std::string, TokenFlaw> const map = [] {
        std::map<std::string, TokenFlaw> m;
        for (auto const &[flaw, name] : magic_enum::enum_entries<TokenFlaw>()) {
            m.emplace(to_snake_case(name), flaw);
        }
        return m;
    }();
    return map;
}

STDPROP_NAMESPACE_END
