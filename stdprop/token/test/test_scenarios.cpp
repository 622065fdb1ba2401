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
#include <stdprop/token/reference_token.hpp>
#include <stdprop/token/subject_adapter.hpp>
#include <stdprop/token/subject_error.hpp>

#include <evmc/evmc.hpp>

#include <intx/intx.hpp>

#include <gtest/gtest.h>

using namespace stdprop;
using namespace evmc::literals;
using namespace intx::literals;

namespace
{
    constexpr auto A = 0x00000000000000000000000000000000000a11ce_address;
    constexpr auto B = 0x0000000000000000000000000000000000000b0b_address;
    constexpr auto C = 0x00000000000000000000000000000000000ca201_address;
    constexpr auto SPENDER = 0x000000000000000000000000000000000000d00d_address;
}

struct ScenarioTest : public ::testing::Test
{
    ReferenceToken token{};
    SubjectAdapter adapter{token};
};

TEST_F(ScenarioTest, overflow_rejection)
{
    ASSERT_FALSE(adapter.mint(A, 100).has_error());
    ASSERT_FALSE(adapter.mint(B, MAX_UINT256 - 50).has_error());
    auto const pre = token.state();

    auto const res = adapter.transfer(A, B, 60);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.error(), SubjectError::Reverted);
    EXPECT_EQ(adapter.last_revert_reason(), "balance overflow");

    EXPECT_EQ(token.state().balance_of(A), 100_u256);
    EXPECT_EQ(token.state().balance_of(B), MAX_UINT256 - 50);
    EXPECT_EQ(token.state(), pre);
}

TEST_F(ScenarioTest, insufficient_allowance)
{
    ASSERT_FALSE(adapter.mint(A, 200).has_error());
    auto const approved = adapter.approve(A, SPENDER, 50);
    ASSERT_TRUE(approved.has_value());
    EXPECT_TRUE(approved.value());

    auto const raw = adapter.raw_transfer_from(SPENDER, A, C, 100);
    ASSERT_TRUE(raw.has_value());
    EXPECT_TRUE(raw.value().is_reverted());
    EXPECT_EQ(raw.value().revert_reason(), "insufficient allowance");

    auto const allowance = adapter.allowance(A, SPENDER);
    ASSERT_TRUE(allowance.has_value());
    EXPECT_EQ(allowance.value(), 50_u256);
    EXPECT_EQ(token.state().balance_of(A), 200_u256);
    EXPECT_EQ(token.state().balance_of(C), 0_u256);
}

TEST_F(ScenarioTest, zero_amount_transfer)
{
    ASSERT_FALSE(adapter.mint(A, 1).has_error());
    auto const pre = token.state();

    auto const res = adapter.transfer(A, B, 0);
    ASSERT_TRUE(res.has_value());
    EXPECT_TRUE(res.value());
    EXPECT_EQ(token.state().balance_of(A), 1_u256);
    EXPECT_EQ(token.state().balance_of(B), 0_u256);
    EXPECT_EQ(token.state(), pre);
}

TEST_F(ScenarioTest, unrelated_account_isolation)
{
    auto const amount = 12345_u256;
    ASSERT_FALSE(adapter.mint(A, amount).has_error());
    ASSERT_FALSE(adapter.mint(C, amount).has_error());
    auto const supply = adapter.total_supply();
    ASSERT_TRUE(supply.has_value());
    EXPECT_EQ(supply.value(), amount + amount);

    auto const res = adapter.transfer(A, B, amount);
    ASSERT_TRUE(res.has_value());
    EXPECT_TRUE(res.value());

    auto const unrelated = adapter.balance_of(C);
    ASSERT_TRUE(unrelated.has_value());
    EXPECT_EQ(unrelated.value(), amount);
    auto const supply_after = adapter.total_supply();
    ASSERT_TRUE(supply_after.has_value());
    EXPECT_EQ(supply_after.value(), supply.value());
    EXPECT_EQ(token.state().balance_of(B), amount);
}

TEST_F(ScenarioTest, self_transfer_is_idempotent)
{
    ASSERT_FALSE(adapter.mint(A, 500).has_error());
    for (auto const amount : {0_u256, 1_u256, 499_u256, 500_u256}) {
        auto const res = adapter.transfer(A, A, amount);
        ASSERT_TRUE(res.has_value());
        EXPECT_TRUE(res.value());
        EXPECT_EQ(token.state().balance_of(A), 500_u256);
    }
}

TEST_F(ScenarioTest, approve_round_trip)
{
    for (auto const value : {0_u256, 1_u256, 77_u256, MAX_UINT256}) {
        auto const approved = adapter.approve(A, SPENDER, value);
        ASSERT_TRUE(approved.has_value());
        EXPECT_TRUE(approved.value());
        auto const allowance = adapter.allowance(A, SPENDER);
        ASSERT_TRUE(allowance.has_value());
        EXPECT_EQ(allowance.value(), value);
    }
}

TEST_F(ScenarioTest, null_address_never_credited)
{
    ASSERT_FALSE(adapter.mint(A, 100).has_error());
    ASSERT_TRUE(adapter.approve(A, SPENDER, 100).has_value());

    auto const direct = adapter.raw_transfer(A, NULL_ADDRESS, 10);
    ASSERT_TRUE(direct.has_value());
    EXPECT_TRUE(direct.value().is_reverted());

    auto const delegated =
        adapter.raw_transfer_from(SPENDER, A, NULL_ADDRESS, 10);
    ASSERT_TRUE(delegated.has_value());
    EXPECT_TRUE(delegated.value().is_reverted());

    EXPECT_EQ(token.state().balance_of(NULL_ADDRESS), 0_u256);
    EXPECT_EQ(token.state().balance_of(A), 100_u256);
    EXPECT_EQ(token.state().allowance_of(A, SPENDER), 100_u256);
}
