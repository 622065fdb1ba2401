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
#include <stdprop/core/basic_formatter.hpp>
#include <stdprop/core/config.hpp>
#include <stdprop/core/fmt/address_fmt.hpp>
#include <stdprop/core/fmt/int_fmt.hpp>
#include <stdprop/core/int.hpp>

#include <fmt/format.h>

STDPROP_NAMESPACE_BEGIN

// Input vector shared by every property. The setup mints the three balances
// and has sender approve spender for allowance; the call under test uses
// the roles and amount its property assigns to them.
struct Assignment
{
    Address sender{};
    Address receiver{};
    Address spender{};
    Address bystander{};
    uint256_t amount{0};
    uint256_t second_amount{0};
    uint256_t sender_balance{0};
    uint256_t receiver_balance{0};
    uint256_t bystander_balance{0};
    uint256_t allowance{0};

    bool operator==(Assignment const &) const = default;
};

STDPROP_NAMESPACE_END

template <>
struct fmt::formatter<stdprop::Assignment> : public stdprop::basic_formatter
{
    template <typename FormatContext>
    auto format(stdprop::Assignment const &a, FormatContext &ctx) const
    {
        return fmt::format_to(
            ctx.out(),
            "sender={} receiver={} spender={} bystander={} amount={} "
            "second_amount={} sender_balance={} receiver_balance={} "
            "bystander_balance={} allowance={}",
            a.sender,
            a.receiver,
            a.spender,
            a.bystander,
            a.amount,
            a.second_amount,
            a.sender_balance,
            a.receiver_balance,
            a.bystander_balance,
            a.allowance);
    }
};
