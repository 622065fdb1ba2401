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
#include <stdprop/core/int.hpp>

#include <intx/intx.hpp>

#include <optional>
#include <utility>

STDPROP_NAMESPACE_BEGIN

// Amount arithmetic over [0, 2^256). Nothing here wraps silently: every
// operation either reports overflow/underflow alongside the wrapped value or
// returns an empty optional.

inline constexpr std::pair<uint256_t, bool>
add(uint256_t const &a, uint256_t const &b) noexcept
{
    auto const r = intx::addc(a, b);
    return {r.value, r.carry};
}

inline constexpr std::pair<uint256_t, bool>
sub(uint256_t const &a, uint256_t const &b) noexcept
{
    auto const r = intx::subc(a, b);
    return {r.value, r.carry};
}

inline constexpr std::optional<uint256_t>
checked_add(uint256_t const &a, uint256_t const &b) noexcept
{
    auto const [value, overflowed] = add(a, b);
    if (overflowed) {
        return std::nullopt;
    }
    return value;
}

inline constexpr std::optional<uint256_t>
checked_sub(uint256_t const &a, uint256_t const &b) noexcept
{
    auto const [value, underflowed] = sub(a, b);
    if (underflowed) {
        return std::nullopt;
    }
    return value;
}

inline constexpr uint256_t
saturating_add(uint256_t const &a, uint256_t const &b) noexcept
{
    auto const [value, overflowed] = add(a, b);
    return overflowed ? MAX_UINT256 : value;
}

inline constexpr uint256_t
saturating_sub(uint256_t const &a, uint256_t const &b) noexcept
{
    auto const [value, underflowed] = sub(a, b);
    return underflowed ? uint256_t{0} : value;
}

STDPROP_NAMESPACE_END
