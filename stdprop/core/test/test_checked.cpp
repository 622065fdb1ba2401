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

#include <stdprop/core/arith/checked.hpp>
#include <stdprop/core/int.hpp>

#include <intx/intx.hpp>

#include <gtest/gtest.h>

using namespace stdprop;
using namespace intx::literals;

TEST(Checked, add_within_range)
{
    auto const [value, overflowed] = add(100_u256, 50_u256);
    EXPECT_EQ(value, 150_u256);
    EXPECT_FALSE(overflowed);
    EXPECT_EQ(checked_add(100_u256, 50_u256), 150_u256);
}

TEST(Checked, add_overflow)
{
    auto const [value, overflowed] = add(MAX_UINT256, 2_u256);
    EXPECT_TRUE(overflowed);
    EXPECT_EQ(value, 1_u256);
    EXPECT_FALSE(checked_add(MAX_UINT256, 1_u256).has_value());
    EXPECT_FALSE(checked_add(MAX_UINT256 - 50, 60_u256).has_value());
    EXPECT_EQ(checked_add(MAX_UINT256 - 50, 50_u256), MAX_UINT256);
}

TEST(Checked, sub_underflow)
{
    auto const [value, underflowed] = sub(0_u256, 1_u256);
    EXPECT_TRUE(underflowed);
    EXPECT_EQ(value, MAX_UINT256);
    EXPECT_FALSE(checked_sub(10_u256, 11_u256).has_value());
    EXPECT_EQ(checked_sub(10_u256, 10_u256), 0_u256);
    EXPECT_EQ(checked_sub(MAX_UINT256, MAX_UINT256), 0_u256);
}

TEST(Checked, saturating)
{
    EXPECT_EQ(saturating_add(MAX_UINT256 - 1, 5_u256), MAX_UINT256);
    EXPECT_EQ(saturating_add(1_u256, 2_u256), 3_u256);
    EXPECT_EQ(saturating_sub(3_u256, 5_u256), 0_u256);
    EXPECT_EQ(saturating_sub(5_u256, 3_u256), 2_u256);
}

TEST(Checked, constexpr_evaluation)
{
    static_assert(checked_add(1_u256, 1_u256) == 2_u256);
    static_assert(!checked_sub(0_u256, 1_u256).has_value());
    static_assert(saturating_add(MAX_UINT256, MAX_UINT256) == MAX_UINT256);
}
