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
#include <stdprop/property/assignment.hpp>
#include <stdprop/property/generator.hpp>

#include <evmc/evmc.hpp>

#include <intx/intx.hpp>

#include <gtest/gtest.h>

#include <algorithm>
#include <cstddef>
#include <utility>

using namespace stdprop;
using namespace evmc::literals;
using namespace intx::literals;

namespace
{
    bool is_canonical(Address const &a)
    {
        return std::ranges::find(CANONICAL_ADDRESSES, a) !=
               CANONICAL_ADDRESSES.end();
    }
}

TEST(Generator, deterministic)
{
    Generator a{42};
    Generator b{42};
    for (size_t i = 0; i < 100; ++i) {
        EXPECT_EQ(a.gen_assignment(), b.gen_assignment());
    }

    Generator c{43};
    Generator d{42};
    bool differs = false;
    for (size_t i = 0; i < 10; ++i) {
        differs |= c.gen_assignment() != d.gen_assignment();
    }
    EXPECT_TRUE(differs);
}

TEST(Generator, bound_biased_within_bounds)
{
    Generator gen{1};
    std::pair<uint256_t, uint256_t> const bounds[] = {
        {0, 0},
        {7, 7},
        {0, 1},
        {5, 1000},
        {MAX_UINT256 - 3, MAX_UINT256},
        {0, MAX_UINT256},
        {1, MAX_UINT256},
    };
    for (auto const &[lower, upper] : bounds) {
        bool hit_lower = false;
        bool hit_upper = false;
        for (size_t i = 0; i < 200; ++i) {
            auto const x = gen.gen_bound_biased_uint256(lower, upper);
            ASSERT_GE(x, lower);
            ASSERT_LE(x, upper);
            hit_lower |= x == lower;
            hit_upper |= x == upper;
        }
        EXPECT_TRUE(hit_lower);
        EXPECT_TRUE(hit_upper);
    }
}

TEST(Generator, adjacent_is_clamped)
{
    Generator gen{2};
    for (size_t i = 0; i < 100; ++i) {
        auto const low = gen.gen_adjacent(0);
        EXPECT_LE(low, 1_u256);
        auto const high = gen.gen_adjacent(MAX_UINT256);
        EXPECT_GE(high, MAX_UINT256 - 1);
        auto const mid = gen.gen_adjacent(100);
        EXPECT_GE(mid, 99_u256);
        EXPECT_LE(mid, 101_u256);
    }
}

TEST(Generator, amounts_hit_edges)
{
    Generator gen{3};
    size_t zero = 0;
    size_t max = 0;
    for (size_t i = 0; i < 1000; ++i) {
        auto const x = gen.gen_amount();
        zero += x == 0;
        max += x == MAX_UINT256;
    }
    EXPECT_GT(zero, 50u);
    EXPECT_GT(max, 50u);
}

TEST(Generator, addresses_alias)
{
    Generator gen{4};
    size_t canonical = 0;
    size_t null = 0;
    for (size_t i = 0; i < 1000; ++i) {
        auto const a = gen.gen_address();
        canonical += is_canonical(a);
        null += is_null(a);
        EXPECT_FALSE(is_null(gen.gen_non_null_address()));
    }
    EXPECT_GT(canonical, 600u);
    EXPECT_GT(null, 50u);
}

TEST(Generator, distinct_address)
{
    Generator gen{5};
    for (size_t i = 0; i < 200; ++i) {
        auto const a = gen.gen_distinct_address(
            CANONICAL_ADDRESSES[0],
            CANONICAL_ADDRESSES[1],
            CANONICAL_ADDRESSES[2]);
        EXPECT_FALSE(is_null(a));
        EXPECT_NE(a, CANONICAL_ADDRESSES[0]);
        EXPECT_NE(a, CANONICAL_ADDRESSES[1]);
        EXPECT_NE(a, CANONICAL_ADDRESSES[2]);
    }
}

TEST(Generator, null_roles_hold_nothing)
{
    Generator gen{6};
    for (size_t i = 0; i < 500; ++i) {
        auto const a = gen.gen_assignment();
        if (is_null(a.sender)) {
            EXPECT_EQ(a.sender_balance, 0_u256);
        }
        if (is_null(a.receiver)) {
            EXPECT_EQ(a.receiver_balance, 0_u256);
        }
        if (is_null(a.bystander)) {
            EXPECT_EQ(a.bystander_balance, 0_u256);
        }
    }
}
