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
#include <stdprop/token/account_state.hpp>
#include <stdprop/token/staged_state.hpp>
#include <stdprop/token/token_error.hpp>

#include <evmc/evmc.hpp>

#include <intx/intx.hpp>

#include <gtest/gtest.h>

using namespace stdprop;
using namespace evmc::literals;
using namespace intx::literals;

namespace
{
    constexpr auto ALICE = 0x00000000000000000000000000000000000a11ce_address;
    constexpr auto BOB = 0x0000000000000000000000000000000000000b0b_address;
    constexpr auto CAROL = 0x00000000000000000000000000000000000ca201_address;
}

struct AccountStateTest : public ::testing::Test
{
    AccountState state{};

    void SetUp() override
    {
        StagedState staged{state};
        staged.set_balance(ALICE, 100);
        staged.set_balance(BOB, 50);
        staged.set_allowance(ALICE, BOB, 30);
        staged.set_total_supply(150);
        ASSERT_FALSE(state.commit(staged.delta()).has_error());
    }
};

TEST_F(AccountStateTest, reads_are_total)
{
    EXPECT_EQ(state.balance_of(ALICE), 100_u256);
    EXPECT_EQ(state.balance_of(CAROL), 0_u256);
    EXPECT_EQ(state.balance_of(NULL_ADDRESS), 0_u256);
    EXPECT_EQ(state.allowance_of(ALICE, BOB), 30_u256);
    EXPECT_EQ(state.allowance_of(BOB, ALICE), 0_u256);
    EXPECT_EQ(state.total_supply(), 150_u256);
}

TEST_F(AccountStateTest, staged_reads_see_writes)
{
    StagedState staged{state};
    staged.set_balance(ALICE, 70);
    EXPECT_EQ(staged.balance_of(ALICE), 70_u256);
    EXPECT_EQ(staged.balance_of(BOB), 50_u256);
    // nothing committed yet
    EXPECT_EQ(state.balance_of(ALICE), 100_u256);

    auto const &delta = staged.delta();
    ASSERT_EQ(delta.balances.size(), 1u);
    EXPECT_EQ(delta.balances.at(ALICE).first, 100_u256);
    EXPECT_EQ(delta.balances.at(ALICE).second, 70_u256);
}

TEST_F(AccountStateTest, commit_applies_whole_delta)
{
    StagedState staged{state};
    staged.set_balance(ALICE, 70);
    staged.set_balance(CAROL, 30);
    staged.set_allowance(ALICE, BOB, 0);
    ASSERT_FALSE(state.commit(staged.delta()).has_error());

    EXPECT_EQ(state.balance_of(ALICE), 70_u256);
    EXPECT_EQ(state.balance_of(CAROL), 30_u256);
    EXPECT_EQ(state.allowance_of(ALICE, BOB), 0_u256);
    EXPECT_EQ(state.total_supply(), 150_u256);
    // zero entries are erased
    EXPECT_FALSE(state.allowances().contains({ALICE, BOB}));
}

TEST_F(AccountStateTest, null_credit_rejected)
{
    auto const before = state;

    StagedState staged{state};
    staged.set_balance(ALICE, 90);
    staged.set_balance(NULL_ADDRESS, 10);
    auto const res = state.commit(staged.delta());
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.error(), TokenError::NullAddressCredit);
    // nothing of the delta was applied
    EXPECT_EQ(state, before);
}

TEST_F(AccountStateTest, equality_ignores_zero_entries)
{
    AccountState other = state;
    StagedState staged{other};
    staged.set_balance(CAROL, 0);
    ASSERT_FALSE(other.commit(staged.delta()).has_error());
    EXPECT_EQ(other, state);
}

TEST_F(AccountStateTest, changes)
{
    auto const pre = state;
    StagedState staged{state};
    staged.set_balance(ALICE, 40);
    staged.set_balance(CAROL, 60);
    staged.set_allowance(ALICE, BOB, 10);
    ASSERT_FALSE(state.commit(staged.delta()).has_error());

    auto const balances = balance_changes(pre, state);
    ASSERT_EQ(balances.size(), 2u);
    EXPECT_EQ(balances.at(ALICE).first, 100_u256);
    EXPECT_EQ(balances.at(ALICE).second, 40_u256);
    EXPECT_EQ(balances.at(CAROL).first, 0_u256);
    EXPECT_EQ(balances.at(CAROL).second, 60_u256);
    EXPECT_FALSE(balances.contains(BOB));

    auto const allowances = allowance_changes(pre, state);
    ASSERT_EQ(allowances.size(), 1u);
    EXPECT_EQ(allowances.at({ALICE, BOB}).second, 10_u256);
}

TEST_F(AccountStateTest, sum_of_balances)
{
    auto const [sum, overflowed] = state.sum_of_balances();
    EXPECT_EQ(sum, 150_u256);
    EXPECT_FALSE(overflowed);

    StagedState staged{state};
    staged.set_balance(CAROL, MAX_UINT256);
    ASSERT_FALSE(state.commit(staged.delta()).has_error());
    EXPECT_TRUE(state.sum_of_balances().second);
}
