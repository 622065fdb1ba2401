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
#include <stdprop/core/fmt/address_fmt.hpp>
#include <stdprop/core/fmt/int_fmt.hpp>
#include <stdprop/core/int.hpp>
#include <stdprop/core/result.hpp>
#include <stdprop/property/assignment.hpp>
#include <stdprop/property/catalog.hpp>
#include <stdprop/property/catalog_util.hpp>
#include <stdprop/property/choice.hpp>
#include <stdprop/property/evaluation.hpp>
#include <stdprop/property/generator.hpp>
#include <stdprop/property/property.hpp>
#include <stdprop/token/account_state.hpp>
#include <stdprop/token/call_outcome.hpp>

#include <boost/outcome/try.hpp>

#include <span>

// The sender approves the spender for the amount.

STDPROP_ANONYMOUS_NAMESPACE_BEGIN

Result<CallOutcome> raw_approve(Evaluation &ev)
{
    auto const &a = ev.input();
    return ev.observe_raw(
        ev.adapter().raw_approve(a.sender, a.spender, a.amount));
}

Result<bool>
typed_approve(Evaluation &ev, uint256_t const &amount)
{
    auto const &a = ev.input();
    return ev.observe_typed(ev.adapter().approve(a.sender, a.spender, amount));
}

Result<void> ensure_allowance(Evaluation &ev, uint256_t const &expected)
{
    auto const &a = ev.input();
    auto const allowance = BOOST_OUTCOME_TRYX(
        ev.observe_typed(ev.adapter().allowance(a.sender, a.spender)));
    return ev.ensure(
        allowance == expected,
        "allowance({}, {}) is {} after approving {}",
        a.sender,
        a.spender,
        allowance,
        expected);
}

void narrow_null_spender(Generator &, Assignment &a)
{
    a.spender = NULL_ADDRESS;
    // seeding an allowance for the null spender would revert
    a.allowance = 0;
}

bool null_spender_precondition(Assignment const &a)
{
    return is_null(a.spender) && a.allowance == 0;
}

Result<void> approve_null_spender_reverts(Evaluation &ev)
{
    auto const observed = BOOST_OUTCOME_TRYX(raw_approve(ev));
    return ev.ensure_reverted(observed, "approve of the null address");
}

void narrow_spender(Generator &gen, Assignment &a)
{
    make_non_null(gen, a.spender);
}

bool spender_non_null(Assignment const &a)
{
    return !is_null(a.spender);
}

Result<void> completed_approve_returns_true(Evaluation &ev)
{
    auto const observed = BOOST_OUTCOME_TRYX(raw_approve(ev));
    BOOST_OUTCOME_TRY(ev.require(observed.is_completed()));
    return ev.ensure(
        observed.returned_true(),
        "approve completed with {}",
        to_string(observed));
}

// Half of the time an allowance is already in place; the approved amount
// hits 0 and MAX often
void narrow_round_trip(Generator &gen, Assignment &a)
{
    make_non_null(gen, a.spender);
    if (gen.toss(0.5)) {
        a.allowance = 0;
    }
    else if (a.allowance == 0) {
        a.allowance = gen.gen_bound_biased_uint256(1, MAX_UINT256);
    }
    a.amount = discrete_choice<uint256_t>(
        gen.engine(),
        [&](auto &) { return a.amount; },
        Choice(0.2, [](auto &) { return uint256_t{0}; }),
        Choice(0.2, [](auto &) { return MAX_UINT256; }));
}

Result<void> approve_then_allowance(Evaluation &ev)
{
    auto const &a = ev.input();
    auto const ok = BOOST_OUTCOME_TRYX(typed_approve(ev, a.amount));
    BOOST_OUTCOME_TRY(ev.ensure(ok, "approve returned false"));
    return ensure_allowance(ev, a.amount);
}

Result<void> approve_overwrites(Evaluation &ev)
{
    auto const &a = ev.input();
    auto const first = BOOST_OUTCOME_TRYX(typed_approve(ev, a.amount));
    BOOST_OUTCOME_TRY(ev.ensure(first, "first approve returned false"));
    auto const second = BOOST_OUTCOME_TRYX(typed_approve(ev, a.second_amount));
    BOOST_OUTCOME_TRY(ev.ensure(second, "second approve returned false"));
    return ensure_allowance(ev, a.second_amount);
}

void narrow_change_set(Generator &gen, Assignment &a)
{
    make_non_null(gen, a.sender);
    if (a.spender == a.sender || is_null(a.spender)) {
        a.spender = gen.gen_distinct_address(a.sender);
    }
}

bool change_set_precondition(Assignment const &a)
{
    return all_non_null({a.sender, a.spender}) && a.sender != a.spender;
}

Result<void> approve_change_set(Evaluation &ev)
{
    auto const &a = ev.input();
    BOOST_OUTCOME_TRY(typed_approve(ev, a.amount));
    for (auto const &[key, values] :
         allowance_changes(ev.pre(), ev.post())) {
        BOOST_OUTCOME_TRY(ev.ensure(
            key == AllowanceKey{a.sender, a.spender},
            "approve changed the allowance of {} for {} from {} to {}",
            key.first,
            key.second,
            values.first,
            values.second));
    }
    auto const balances = balance_changes(ev.pre(), ev.post());
    BOOST_OUTCOME_TRY(ev.ensure(
        balances.empty(),
        "approve changed {} balances",
        balances.size()));
    return ev.ensure(
        ev.post().total_supply() == ev.pre().total_supply(),
        "approve changed the total supply from {} to {}",
        ev.pre().total_supply(),
        ev.post().total_supply());
}

Property const PROPERTIES[] = {
    {"ERC20-STDPROP-32",
     "approveZeroAddressReverts",
     Operation::Approve,
     CallMode::Raw,
     "approve of the null address as spender reverts",
     narrow_null_spender,
     null_spender_precondition,
     approve_null_spender_reverts},
    {"ERC20-STDPROP-33",
     "approveReturnsTrue",
     Operation::Approve,
     CallMode::Raw,
     "an approve that completes returns true",
     narrow_spender,
     spender_non_null,
     completed_approve_returns_true},
    {"ERC20-STDPROP-34",
     "approveSetsAllowance",
     Operation::Approve,
     CallMode::Typed,
     "approve of X followed by allowance reads X, for X from 0 to MAX",
     narrow_round_trip,
     spender_non_null,
     approve_then_allowance},
    {"ERC20-STDPROP-35",
     "approveOverwrites",
     Operation::Approve,
     CallMode::Typed,
     "a second approve replaces the allowance instead of adding to it",
     narrow_spender,
     spender_non_null,
     approve_overwrites},
    {"ERC20-STDPROP-36",
     "approveChangeState",
     Operation::Approve,
     CallMode::Typed,
     "approve changes only the allowance of the owner for the spender",
     narrow_change_set,
     change_set_precondition,
     approve_change_set},
};

STDPROP_ANONYMOUS_NAMESPACE_END

STDPROP_NAMESPACE_BEGIN

std::span<Property const> approve_properties()
{
    return PROPERTIES;
}

STDPROP_NAMESPACE_END
