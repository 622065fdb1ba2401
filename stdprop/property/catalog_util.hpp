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
#include <stdprop/core/arith/checked.hpp>
#include <stdprop/core/config.hpp>
#include <stdprop/core/int.hpp>
#include <stdprop/property/assignment.hpp>
#include <stdprop/property/generator.hpp>

#include <algorithm>
#include <initializer_list>

STDPROP_NAMESPACE_BEGIN

// Narrowing helpers shared by the catalog. Each one moves a single part of
// the assignment into the region a property cares about and keeps the
// generated value where it already fits.

inline bool any_assignment(Assignment const &)
{
    return true;
}

inline bool all_non_null(std::initializer_list<Address> const addresses)
{
    return std::ranges::none_of(addresses, is_null);
}

inline void make_non_null(Generator &gen, Address &address)
{
    if (is_null(address)) {
        address = gen.gen_non_null_address();
    }
}

inline void make_null(Address &address, uint256_t &balance)
{
    address = NULL_ADDRESS;
    balance = 0;
}

// amount <= sender_balance
inline void make_affordable(Generator &gen, Assignment &a)
{
    if (a.amount > a.sender_balance) {
        a.amount = gen.gen_bound_biased_uint256(0, a.sender_balance);
    }
}

// receiver_balance + amount <= MAX
inline void make_creditable(Generator &gen, Assignment &a)
{
    auto const room = MAX_UINT256 - a.amount;
    if (a.receiver_balance > room) {
        a.receiver_balance = gen.gen_bound_biased_uint256(0, room);
    }
}

// allowance >= amount
inline void make_covered(Generator &gen, Assignment &a)
{
    if (a.allowance < a.amount) {
        a.allowance = gen.gen_bound_biased_uint256(a.amount, MAX_UINT256);
    }
}

// sender -> receiver transfer that the standard allows to complete
inline void make_transferable(Generator &gen, Assignment &a)
{
    make_non_null(gen, a.sender);
    make_non_null(gen, a.receiver);
    make_affordable(gen, a);
    make_creditable(gen, a);
}

// receiver_balance + amount > MAX with amount <= sender_balance, the
// bystander holding nothing so it cannot add to either side
inline void make_receiver_overflow(Generator &gen, Assignment &a)
{
    make_non_null(gen, a.sender);
    if (a.receiver == a.sender || is_null(a.receiver)) {
        a.receiver = gen.gen_distinct_address(a.sender);
    }
    a.bystander_balance = 0;
    if (a.receiver_balance == 0) {
        a.receiver_balance = gen.gen_bound_biased_uint256(1, MAX_UINT256);
    }
    if (!add(a.receiver_balance, a.amount).second) {
        a.amount = gen.gen_bound_biased_uint256(
            MAX_UINT256 - a.receiver_balance + 1, MAX_UINT256);
    }
    if (a.sender_balance < a.amount) {
        a.sender_balance = gen.gen_bound_biased_uint256(a.amount, MAX_UINT256);
    }
}

STDPROP_NAMESPACE_END
