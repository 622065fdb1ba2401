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

#include <stdprop/core/address.hpp>
#include <stdprop/core/config.hpp>
#include <stdprop/core/int.hpp>
#include <stdprop/property/assignment.hpp>

#include <array>
#include <cstdint>
#include <random>

STDPROP_NAMESPACE_BEGIN

// Small fixed pool that random addresses are drawn from most of the time, so
// that roles alias each other often. Shrinking also moves addresses towards
// the front of this pool.
inline constexpr std::array<Address, 4> CANONICAL_ADDRESSES = {
    Address{0xa11ce}, Address{0xb0b}, Address{0xca201}, Address{0xd00d}};

class Generator
{
public:
    using engine_t = std::mt19937_64;
    using seed_t = engine_t::result_type;

private:
    engine_t engine_;

public:
    explicit Generator(seed_t);

    engine_t &engine() noexcept
    {
        return engine_;
    }

    seed_t gen();
    bool toss(double probability);

    uint256_t gen_uint256();

    // Random value in [lower, upper], biased towards lower, lower + 1,
    // upper - 1 and upper.
    uint256_t
    gen_bound_biased_uint256(uint256_t const &lower, uint256_t const &upper);

    // Full range amount, biased towards 0, 1, small values, MAX - 1 and MAX
    uint256_t gen_amount();

    // pivot - 1, pivot or pivot + 1, clamped to the domain
    uint256_t gen_adjacent(uint256_t const &pivot);

    Address gen_canonical_address();
    Address gen_random_address();
    Address gen_non_null_address();

    // Null, canonical or fresh random
    Address gen_address();

    // Non-null address different from all of the given ones
    Address gen_distinct_address(
        Address const &a, Address const &b = NULL_ADDRESS,
        Address const &c = NULL_ADDRESS);

    Assignment gen_assignment();
};

STDPROP_NAMESPACE_END
