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
#include <stdprop/core/arith/checked.hpp>
#include <stdprop/core/assert.h>
#include <stdprop/core/int.hpp>
#include <stdprop/property/assignment.hpp>
#include <stdprop/property/choice.hpp>
#include <stdprop/property/generator.hpp>

#include <intx/intx.hpp>

#include <cstring>
#include <random>

STDPROP_NAMESPACE_BEGIN

Generator::Generator(seed_t const seed)
    : engine_{seed}
{
}

Generator::seed_t Generator::gen()
{
    return engine_();
}

bool Generator::toss(double const probability)
{
    return stdprop::toss(engine_, probability);
}

uint256_t Generator::gen_uint256()
{
    return uint256_t{gen(), gen(), gen(), gen()};
}

uint256_t Generator::gen_bound_biased_uint256(
    uint256_t const &lower, uint256_t const &upper)
{
    STDPROP_ASSERT(lower <= upper);
    return discrete_choice<uint256_t>(
        engine_,
        [&, this](auto &) {
            auto const x = gen_uint256();
            auto const m = upper - lower + 1;
            return m ? lower + x % m : x;
        },
        Choice(
            0.10,
            [&](auto &) { return lower == upper ? lower : lower + 1; }),
        Choice(
            0.10,
            [&](auto &) { return lower == upper ? upper : upper - 1; }),
        Choice(0.10, [&](auto &) { return lower; }),
        Choice(0.10, [&](auto &) { return upper; }));
}

uint256_t Generator::gen_amount()
{
    return discrete_choice<uint256_t>(
        engine_,
        [this](auto &) { return gen_uint256(); },
        Choice(0.10, [](auto &) { return uint256_t{0}; }),
        Choice(0.10, [](auto &) { return uint256_t{1}; }),
        Choice(0.25, [this](auto &) { return uint256_t{gen() % 1'000'000}; }),
        Choice(0.10, [](auto &) { return MAX_UINT256 - 1; }),
        Choice(0.10, [](auto &) { return MAX_UINT256; }),
        Choice(0.10, [this](auto &) {
            // magnitudes an order below MAX, so sums of two may overflow
            return gen_uint256() >> 1;
        }));
}

uint256_t Generator::gen_adjacent(uint256_t const &pivot)
{
    return discrete_choice<uint256_t>(
        engine_,
        [&](auto &) { return pivot; },
        Choice(0.33, [&](auto &) { return saturating_sub(pivot, 1); }),
        Choice(0.33, [&](auto &) { return saturating_add(pivot, 1); }));
}

Address Generator::gen_canonical_address()
{
    return CANONICAL_ADDRESSES[gen() % CANONICAL_ADDRESSES.size()];
}

Address Generator::gen_random_address()
{
    auto const x = gen_uint256();
    Address a;
    std::memcpy(a.bytes, intx::as_bytes(x), sizeof(a.bytes));
    return a;
}

Address Generator::gen_non_null_address()
{
    for (;;) {
        auto const a = discrete_choice<Address>(
            engine_,
            [this](auto &) { return gen_random_address(); },
            Choice(0.80, [this](auto &) { return gen_canonical_address(); }));
        if (!is_null(a)) {
            return a;
        }
    }
}

Address Generator::gen_address()
{
    return discrete_choice<Address>(
        engine_,
        [this](auto &) { return gen_non_null_address(); },
        Choice(0.10, [](auto &) { return NULL_ADDRESS; }));
}

Address Generator::gen_distinct_address(
    Address const &a, Address const &b, Address const &c)
{
    for (;;) {
        auto const x = gen_non_null_address();
        if (x != a && x != b && x != c) {
            return x;
        }
    }
}

Assignment Generator::gen_assignment()
{
    Assignment a;
    a.sender = gen_address();
    a.receiver = gen_address();
    a.spender = gen_address();
    a.bystander = gen_address();
    // the null address never holds a balance
    a.sender_balance = is_null(a.sender) ? 0 : gen_amount();
    a.receiver_balance = is_null(a.receiver) ? 0 : gen_amount();
    a.bystander_balance = is_null(a.bystander) ? 0 : gen_amount();
    a.allowance = gen_amount();
    a.second_amount = gen_amount();
    a.amount = discrete_choice<uint256_t>(
        engine_,
        [this](auto &) { return gen_amount(); },
        Choice(
            0.20, [&, this](auto &) { return gen_adjacent(a.sender_balance); }),
        Choice(0.15, [&, this](auto &) { return gen_adjacent(a.allowance); }),
        Choice(0.10, [&, this](auto &) {
            return gen_adjacent(MAX_UINT256 - a.receiver_balance);
        }));
    return a;
}

STDPROP_NAMESPACE_END
