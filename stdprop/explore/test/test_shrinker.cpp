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
#include <stdprop/explore/shrinker.hpp>
#include <stdprop/property/assignment.hpp>
#include <stdprop/property/catalog.hpp>
#include <stdprop/property/evaluation.hpp>
#include <stdprop/property/evaluation_error.hpp>
#include <stdprop/property/generator.hpp>
#include <stdprop/property/property.hpp>
#include <stdprop/token/reference_token.hpp>
#include <stdprop/token/token_flaw.hpp>
#include <stdprop/token/token_subject.hpp>

#include <evmc/evmc.hpp>

#include <intx/intx.hpp>

#include <gtest/gtest.h>

#include <cstddef>
#include <utility>

using namespace stdprop;
using namespace evmc::literals;
using namespace intx::literals;

namespace
{
    constexpr auto STRANGER =
        0x5555555555555555555555555555555555555555_address;
}

struct ShrinkerTest : public ::testing::Test
{
    SubjectFactory factory{};
    Property const *property{nullptr};

    void use(TokenFlaw const flaw, char const *const id)
    {
        factory = make_reference_token_factory({.flaws = {flaw}});
        property = find_property(id);
        ASSERT_NE(property, nullptr);
    }

    EvaluationRecord fail(Assignment const &input)
    {
        EvaluationRecord record;
        auto const res = evaluate(*property, factory, input, 16, record);
        EXPECT_TRUE(res.has_error());
        if (res.has_error()) {
            EXPECT_EQ(res.error(), EvaluationError::PropertyViolation);
        }
        return record;
    }
};

TEST_F(ShrinkerTest, burn_to_minimal_witness)
{
    use(TokenFlaw::ZeroAddressBurns, "08");
    Assignment const witness{
        .sender = STRANGER,
        .receiver = NULL_ADDRESS,
        .spender = CANONICAL_ADDRESSES[1],
        .bystander = CANONICAL_ADDRESSES[3],
        .amount = 123456789,
        .second_amount = 42,
        .sender_balance = MAX_UINT256 - 7,
        .receiver_balance = 0,
        .bystander_balance = 1000,
        .allowance = 77};
    auto record = fail(witness);
    ASSERT_EQ(record.defect, DefectKind::PropertyViolation);

    Shrinker const shrinker{*property, factory, 16, 64};
    auto const result = shrinker.shrink(witness, std::move(record));

    Assignment const expected{
        .sender = CANONICAL_ADDRESSES[0],
        .receiver = NULL_ADDRESS,
        .spender = CANONICAL_ADDRESSES[0],
        .bystander = CANONICAL_ADDRESSES[0]};
    EXPECT_EQ(result.assignment, expected);
    EXPECT_EQ(result.record.defect, DefectKind::PropertyViolation);
    EXPECT_EQ(
        result.record.message,
        "transfer to the null address completed instead of reverting: "
        "Completed(true)");
    EXPECT_GT(result.steps, 0u);
    EXPECT_GE(result.rounds, 2u);
}

TEST_F(ShrinkerTest, keeps_defect_kind)
{
    use(TokenFlaw::ReturnFalseOnFailure, "11");
    Assignment const witness{
        .sender = CANONICAL_ADDRESSES[2],
        .receiver = CANONICAL_ADDRESSES[3],
        .spender = CANONICAL_ADDRESSES[1],
        .bystander = CANONICAL_ADDRESSES[1],
        .amount = 500,
        .sender_balance = 100,
        .receiver_balance = 3};
    auto record = fail(witness);
    ASSERT_EQ(record.defect, DefectKind::CompletedFalse);

    Shrinker const shrinker{*property, factory, 16, 64};
    auto const result = shrinker.shrink(witness, std::move(record));
    EXPECT_EQ(result.record.defect, DefectKind::CompletedFalse);
    EXPECT_EQ(result.assignment.amount, 1_u256);
    EXPECT_EQ(result.assignment.sender_balance, 0_u256);
    EXPECT_EQ(result.assignment.receiver_balance, 0_u256);
    EXPECT_FALSE(is_null(result.assignment.sender));
    EXPECT_FALSE(is_null(result.assignment.receiver));
}

TEST_F(ShrinkerTest, round_limit)
{
    use(TokenFlaw::ZeroAddressBurns, "08");
    Assignment const witness{
        .sender = STRANGER,
        .receiver = NULL_ADDRESS,
        .spender = STRANGER,
        .bystander = STRANGER,
        .amount = 1000,
        .sender_balance = 5000};
    Shrinker const shrinker{*property, factory, 16, 1};
    auto const result = shrinker.shrink(witness, fail(witness));
    EXPECT_EQ(result.rounds, 1u);
    EXPECT_EQ(result.record.defect, DefectKind::PropertyViolation);
}

TEST_F(ShrinkerTest, deterministic)
{
    use(TokenFlaw::TransferFee, "15");
    Generator gen{7};
    size_t found = 0;
    for (size_t i = 0; found < 3 && i < 1000; ++i) {
        auto input = gen.gen_assignment();
        property->narrow(gen, input);
        if (!property->precondition(input)) {
            continue;
        }
        EvaluationRecord record;
        if (evaluate(*property, factory, input, 16, record).has_value() ||
            record.defect == DefectKind::None) {
            continue;
        }
        ++found;
        Shrinker const shrinker{*property, factory, 16, 64};
        auto const a = shrinker.shrink(input, record);
        auto const b = shrinker.shrink(input, record);
        EXPECT_EQ(a.assignment, b.assignment);
        EXPECT_EQ(a.steps, b.steps);
        // one percent of the amount must round to at least one
        EXPECT_EQ(a.assignment.amount, 100_u256);
    }
    EXPECT_EQ(found, 3u);
}
