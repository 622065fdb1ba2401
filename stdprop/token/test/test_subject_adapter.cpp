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
#include <stdprop/core/byte_string.hpp>
#include <stdprop/core/int.hpp>
#include <stdprop/core/result.hpp>
#include <stdprop/token/abi/abi_encode.hpp>
#include <stdprop/token/abi/abi_signatures.hpp>
#include <stdprop/token/account_state.hpp>
#include <stdprop/token/call_outcome.hpp>
#include <stdprop/token/reference_token.hpp>
#include <stdprop/token/subject_adapter.hpp>
#include <stdprop/token/subject_error.hpp>
#include <stdprop/token/token_flaw.hpp>
#include <stdprop/token/token_subject.hpp>

#include <boost/outcome/success_failure.hpp>

#include <evmc/evmc.h>
#include <evmc/evmc.hpp>

#include <intx/intx.hpp>

#include <gtest/gtest.h>

#include <cstdint>
#include <utility>

using namespace stdprop;
using namespace evmc::literals;
using namespace intx::literals;

namespace
{
    constexpr auto ALICE = 0x00000000000000000000000000000000000a11ce_address;
    constexpr auto BOB = 0x0000000000000000000000000000000000000b0b_address;

    // Completes every call with the same canned output
    class CannedSubject final : public TokenSubject
    {
        AccountState state_{};
        byte_string output_;

    public:
        explicit CannedSubject(byte_string output)
            : output_{std::move(output)}
        {
        }

        Result<void> mint(Address const &, uint256_t const &) override
        {
            return outcome::success();
        }

        evmc::Result call(evmc_message const &msg) override
        {
            return evmc::Result(
                EVMC_SUCCESS, msg.gas, 0, output_.data(), output_.size());
        }

        AccountState const &state() const override
        {
            return state_;
        }
    };
}

struct SubjectAdapterTest : public ::testing::Test
{
    ReferenceToken token{};
    SubjectAdapter adapter{token};

    void SetUp() override
    {
        ASSERT_FALSE(adapter.mint(ALICE, 1000).has_error());
    }
};

TEST_F(SubjectAdapterTest, typed_transfer)
{
    auto const res = adapter.transfer(ALICE, BOB, 400);
    ASSERT_TRUE(res.has_value());
    EXPECT_TRUE(res.value());
    EXPECT_EQ(token.state().balance_of(ALICE), 600_u256);
    EXPECT_EQ(token.state().balance_of(BOB), 400_u256);
}

TEST_F(SubjectAdapterTest, typed_revert)
{
    auto const res = adapter.transfer(ALICE, BOB, 1001);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.error(), SubjectError::Reverted);
    EXPECT_EQ(adapter.last_revert_reason(), "insufficient balance");
}

TEST_F(SubjectAdapterTest, raw_outcomes)
{
    auto const completed = adapter.raw_transfer(ALICE, BOB, 1);
    ASSERT_TRUE(completed.has_value());
    EXPECT_TRUE(completed.value().returned_true());
    EXPECT_EQ(to_string(completed.value()), "Completed(true)");

    auto const reverted = adapter.raw_transfer(BOB, ALICE, 2);
    ASSERT_TRUE(reverted.has_value());
    EXPECT_TRUE(reverted.value().is_reverted());
    EXPECT_FALSE(reverted.value().return_value.has_value());
    EXPECT_EQ(
        to_string(reverted.value()), "Reverted(\"insufficient balance\")");

    auto const supply = adapter.raw_total_supply();
    ASSERT_TRUE(supply.has_value());
    EXPECT_EQ(supply.value().word(), 1000_u256);
    EXPECT_EQ(to_string(supply.value()), "Completed(1000)");
}

TEST_F(SubjectAdapterTest, unknown_selector_reverts)
{
    auto const res = adapter.raw_call(
        ALICE, abi_encode_call(abi_encode_selector("name()"), {}));
    ASSERT_TRUE(res.has_value());
    EXPECT_TRUE(res.value().is_reverted());
    EXPECT_EQ(res.value().revert_reason(), "method not supported");

    auto const empty = adapter.raw_call(ALICE, byte_string{});
    ASSERT_TRUE(empty.has_value());
    EXPECT_TRUE(empty.value().is_reverted());
}

TEST_F(SubjectAdapterTest, truncated_arguments_revert)
{
    auto calldata = abi_encode_call(
        TRANSFER_SELECTOR, {abi_encode_address(BOB), abi_encode_uint(5)});
    calldata.pop_back();
    auto const res = adapter.raw_call(ALICE, calldata);
    ASSERT_TRUE(res.has_value());
    EXPECT_TRUE(res.value().is_reverted());
    EXPECT_EQ(token.state().balance_of(ALICE), 1000_u256);
}

TEST_F(SubjectAdapterTest, trailing_calldata_ignored)
{
    auto calldata = abi_encode_call(
        TRANSFER_SELECTOR, {abi_encode_address(BOB), abi_encode_uint(5)});
    calldata.push_back(0xff);
    auto const res = adapter.raw_call(ALICE, calldata);
    ASSERT_TRUE(res.has_value());
    EXPECT_TRUE(res.value().returned_true());
    EXPECT_EQ(token.state().balance_of(BOB), 5_u256);
}

TEST(SubjectAdapter, step_budget)
{
    ReferenceToken token{};
    SubjectAdapter adapter{token, 3};

    ASSERT_FALSE(adapter.mint(ALICE, 10).has_error());
    ASSERT_TRUE(adapter.transfer(ALICE, BOB, 1).has_value());
    ASSERT_TRUE(adapter.raw_balance_of(BOB).has_value());
    EXPECT_EQ(adapter.steps(), 3u);

    auto const raw = adapter.raw_transfer(ALICE, BOB, 1);
    ASSERT_TRUE(raw.has_error());
    EXPECT_EQ(raw.error(), SubjectError::StepBudgetExceeded);

    auto const minted = adapter.mint(ALICE, 1);
    ASSERT_TRUE(minted.has_error());
    EXPECT_EQ(minted.error(), SubjectError::StepBudgetExceeded);

    // calls past the budget never reach the subject
    EXPECT_EQ(token.state().balance_of(ALICE), 9_u256);
    EXPECT_EQ(adapter.steps(), 3u);
}

TEST(SubjectAdapter, missing_return_value)
{
    ReferenceToken token{{.flaws = {TokenFlaw::MissingReturnValue}}};
    SubjectAdapter adapter{token};
    ASSERT_FALSE(adapter.mint(ALICE, 10).has_error());

    auto const raw = adapter.raw_transfer(ALICE, BOB, 1);
    ASSERT_TRUE(raw.has_value());
    EXPECT_TRUE(raw.value().returned_malformed());
    EXPECT_TRUE(raw.value().output.empty());

    auto const typed = adapter.transfer(ALICE, BOB, 1);
    ASSERT_TRUE(typed.has_error());
    EXPECT_EQ(typed.error(), SubjectError::MalformedReturn);
    EXPECT_EQ(token.state().balance_of(BOB), 2_u256);
}

TEST(SubjectAdapter, malformed_words)
{
    {
        CannedSubject subject{to_byte_string(abi_encode_uint(2))};
        SubjectAdapter adapter{subject};
        auto const raw = adapter.raw_approve(ALICE, BOB, 1);
        ASSERT_TRUE(raw.has_value());
        EXPECT_TRUE(raw.value().returned_malformed());
        EXPECT_EQ(adapter.approve(ALICE, BOB, 1).error(),
                  SubjectError::MalformedReturn);
    }
    {
        // two words where one is expected
        auto output = to_byte_string(abi_encode_bool(true));
        output += to_byte_string(abi_encode_bool(true));
        CannedSubject subject{output};
        SubjectAdapter adapter{subject};
        auto const raw = adapter.raw_transfer(ALICE, BOB, 1);
        ASSERT_TRUE(raw.has_value());
        EXPECT_TRUE(raw.value().returned_malformed());
        EXPECT_EQ(adapter.balance_of(ALICE).error(),
                  SubjectError::MalformedReturn);
    }
    {
        CannedSubject subject{to_byte_string(abi_encode_bool(false))};
        SubjectAdapter adapter{subject};
        auto const raw = adapter.raw_transfer(ALICE, BOB, 1);
        ASSERT_TRUE(raw.has_value());
        EXPECT_TRUE(raw.value().returned_false());
        auto const typed = adapter.transfer(ALICE, BOB, 1);
        ASSERT_TRUE(typed.has_value());
        EXPECT_FALSE(typed.value());
    }
}
