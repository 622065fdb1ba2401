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

#include <stdprop/core/basic_formatter.hpp>
#include <stdprop/core/int.hpp>

#include <fmt/format.h>

#include <intx/intx.hpp>

// Values within 2^16 of MAX print as MAX-n
template <>
struct fmt::formatter<stdprop::uint256_t> : public stdprop::basic_formatter
{
    template <typename FormatContext>
    auto format(stdprop::uint256_t const &value, FormatContext &ctx) const
    {
        auto const distance = stdprop::MAX_UINT256 - value;
        if (distance < 0x10000) {
            if (distance == 0) {
                return fmt::format_to(ctx.out(), "MAX");
            }
            return fmt::format_to(
                ctx.out(), "MAX-{}", intx::to_string(distance));
        }
        return fmt::format_to(ctx.out(), "{}", intx::to_string(value));
    }
};
