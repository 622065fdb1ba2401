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
#include <stdprop/token/token_flaw.hpp>

#include <evmc/evmc.hpp>

#include <intx/intx.hpp>

#include <magic_enum.hpp>

#include <gtest/gtest.h>

#include <memory>

using namespace stdprop;
using namespace evmc::literals;
using namespace intx::literals;

namespace
{
    constexpr auto ALICE = 0x00000000000000000000000000000000000a11ce_address;
    constexpr auto BOB = 0x0000000000000000000000000000000000000b0b_address;
    constexpr auto CAROL = 0x00000000000000000000000000000000000ca201_address;
}

struct FlawTest : public ::testing::Test
{
    std::unique_ptr<ReferenceToken> token{};
    std::unique_ptr<SubjectAdapter> adapter{};

    void with(TokenFlaw const flaw)
    {
        adapter.reset();
        token = std::make_unique<ReferenceToken>(
            ReferenceToken::Config{.flaws = {flaw}});
        adapter = std::make_unique<SubjectAdapter>(*token);
        ASSERT_FALSE(adapter->mint(ALICE, 1000).has_error());
    }

    AccountState const &state() const
    {
        return token->state();
    }
};

TEST(TokenFlaw, names)
{
    auto const &names = flaw_name_map();
    EXPECT_EQ(names.size(), magic_enum::enum_count<TokenFlaw>());
    EXPECT_EQ(names.at("zero_address_burns"), TokenFlaw::ZeroAddressBurns);
    EXPECT_EQ(
        names.at("return_false_on_failure"), TokenFlaw::ReturnFalseOnFailure);
    EXPECT_EQ(names.at("mint_skips_supply"), TokenFlaw::MintSkipsSupply);
    EXPECT_EQ(flaw_name(TokenFlaw::TransferFee), "TransferFee");
    for (auto const flaw : magic_enum::enum_values<TokenFlaw>()) {
        EXPECT_FALSE(flaw_description(flaw).empty());
    }
}

TEST_F(FlawTest, zero_address_burns)
{
    with(TokenFlaw::ZeroAddressBurns);
    auto const raw = adapter->raw_transfer(ALICE, NULL_ADDRESS, 100);
    ASSERT_TRUE(raw.has_value());
    EXPECT_TRUE(raw.value().returned_true());
    EXPECT_EQ(state().balance_of(ALICE), 900_u256);
    EXPECT_EQ(state().balance_of(NULL_ADDRESS), 0_u256);
    EXPECT_EQ(state().total_supply(), 900_u256);
}

TEST_F(FlawTest, return_false_on_failure)
{
    with(TokenFlaw::ReturnFalseOnFailure);
    auto const pre = state();
    auto const raw = adapter->raw_transfer(ALICE, BOB, 1001);
    ASSERT_TRUE(raw.has_value());
    EXPECT_TRUE(raw.value().returned_false());
    EXPECT_EQ(state(), pre);

    // other failures still revert
    auto const null = adapter->raw_transfer(ALICE, NULL_ADDRESS, 1);
    ASSERT_TRUE(null.has_value());
    EXPECT_TRUE(null.value().is_reverted());
}

TEST_F(FlawTest, wrapping_credit)
{
    with(TokenFlaw::WrappingCredit);
    ASSERT_FALSE(adapter->mint(BOB, MAX_UINT256 - 50).has_error());
    auto const raw = adapter->raw_transfer(ALICE, BOB, 60);
    ASSERT_TRUE(raw.has_value());
    EXPECT_TRUE(raw.value().returned_true());
    EXPECT_EQ(state().balance_of(BOB), 9_u256);
    EXPECT_EQ(state().balance_of(ALICE), 940_u256);
}

TEST_F(FlawTest, self_transfer_credits)
{
    with(TokenFlaw::SelfTransferCredits);
    ASSERT_TRUE(adapter->transfer(ALICE, ALICE, 10).value());
    EXPECT_EQ(state().balance_of(ALICE), 1010_u256);
}

TEST_F(FlawTest, transfer_fee)
{
    with(TokenFlaw::TransferFee);
    ASSERT_TRUE(adapter->transfer(ALICE, BOB, 500).value());
    EXPECT_EQ(state().balance_of(ALICE), 500_u256);
    EXPECT_EQ(state().balance_of(BOB), 495_u256);
    EXPECT_EQ(state().total_supply(), 995_u256);

    // below one percent granularity nothing is burned
    ASSERT_TRUE(adapter->transfer(ALICE, BOB, 99).value());
    EXPECT_EQ(state().balance_of(BOB), 594_u256);
}

TEST_F(FlawTest, transfer_resets_allowance)
{
    with(TokenFlaw::TransferResetsAllowance);
    ASSERT_TRUE(adapter->approve(ALICE, BOB, 300).value());
    ASSERT_TRUE(adapter->transfer(ALICE, BOB, 1).value());
    EXPECT_EQ(state().allowance_of(ALICE, BOB), 0_u256);
}

TEST_F(FlawTest, allowance_unchecked)
{
    with(TokenFlaw::AllowanceUnchecked);
    auto const res = adapter->transfer_from(CAROL, ALICE, BOB, 100);
    ASSERT_TRUE(res.has_value());
    EXPECT_TRUE(res.value());
    EXPECT_EQ(state().balance_of(BOB), 100_u256);
    EXPECT_EQ(state().allowance_of(ALICE, CAROL), 0_u256);
}

TEST_F(FlawTest, allowance_not_consumed)
{
    with(TokenFlaw::AllowanceNotConsumed);
    ASSERT_TRUE(adapter->approve(ALICE, CAROL, 300).value());
    ASSERT_TRUE(adapter->transfer_from(CAROL, ALICE, BOB, 100).value());
    EXPECT_EQ(state().allowance_of(ALICE, CAROL), 300_u256);
}

TEST_F(FlawTest, approve_accumulates)
{
    with(TokenFlaw::ApproveAccumulates);
    ASSERT_TRUE(adapter->approve(ALICE, CAROL, 300).value());
    ASSERT_TRUE(adapter->approve(ALICE, CAROL, 5).value());
    EXPECT_EQ(state().allowance_of(ALICE, CAROL), 305_u256);
}

TEST_F(FlawTest, approve_mirrors_allowance)
{
    with(TokenFlaw::ApproveMirrorsAllowance);
    ASSERT_TRUE(adapter->approve(ALICE, CAROL, 300).value());
    EXPECT_EQ(state().allowance_of(ALICE, CAROL), 300_u256);
    EXPECT_EQ(state().allowance_of(CAROL, ALICE), 300_u256);
}

TEST_F(FlawTest, zero_amount_reverts)
{
    with(TokenFlaw::ZeroAmountReverts);
    auto const res = adapter->transfer(ALICE, BOB, 0);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.error(), SubjectError::Reverted);
}

TEST_F(FlawTest, balance_of_null_reverts)
{
    with(TokenFlaw::BalanceOfNullReverts);
    EXPECT_TRUE(adapter->raw_balance_of(NULL_ADDRESS).value().is_reverted());
    EXPECT_EQ(adapter->balance_of(ALICE).value(), 1000_u256);
}

TEST_F(FlawTest, total_supply_off_by_one)
{
    with(TokenFlaw::TotalSupplyOffByOne);
    EXPECT_EQ(adapter->total_supply().value(), 1001_u256);
    EXPECT_EQ(state().total_supply(), 1000_u256);
}

TEST_F(FlawTest, mint_skips_supply)
{
    with(TokenFlaw::MintSkipsSupply);
    EXPECT_EQ(state().balance_of(ALICE), 1000_u256);
    EXPECT_EQ(adapter->total_supply().value(), 0_u256);
}

TEST_F(FlawTest, self_transfer_from_pays_spender)
{
    with(TokenFlaw::SelfTransferFromPaysSpender);
    ASSERT_TRUE(adapter->approve(ALICE, CAROL, 100).value());

    ASSERT_TRUE(adapter->transfer_from(CAROL, ALICE, ALICE, 40).value());
    EXPECT_EQ(state().balance_of(ALICE), 1000_u256);
    EXPECT_EQ(state().balance_of(CAROL), 40_u256);
    EXPECT_EQ(state().allowance_of(ALICE, CAROL), 60_u256);
    EXPECT_EQ(state().total_supply(), 1000_u256);
    EXPECT_EQ(state().sum_of_balances().first, 1040_u256);

    // a transfer between two accounts is unaffected
    ASSERT_TRUE(adapter->transfer_from(CAROL, ALICE, BOB, 10).value());
    EXPECT_EQ(state().balance_of(CAROL), 40_u256);
    EXPECT_EQ(state().balance_of(BOB), 10_u256);
}
