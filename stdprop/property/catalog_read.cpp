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
#include <stdprop/property/evaluation.hpp>
#include <stdprop/property/generator.hpp>
#include <stdprop/property/property.hpp>
#include <stdprop/token/call_outcome.hpp>

#include <boost/outcome/try.hpp>

#include <span>

STDPROP_ANONYMOUS_NAMESPACE_BEGIN

Result<void> ensure_word_returned(
    Evaluation &ev, CallOutcome const &observed, std::string_view const what)
{
    BOOST_OUTCOME_TRY(ev.ensure(
        observed.is_completed(), "{} reverted: {}", what, to_string(observed)));
    BOOST_OUTCOME_TRY(ev.ensure(
        observed.word().has_value(),
        "{} returned {} bytes instead of one word",
        what,
        observed.output.size()));
    return ev.ensure_unchanged();
}

Result<void> total_supply_never_reverts(Evaluation &ev)
{
    auto const observed =
        BOOST_OUTCOME_TRYX(ev.observe_raw(ev.adapter().raw_total_supply()));
    return ensure_word_returned(ev, observed, "totalSupply");
}

Result<void> total_supply_matches(Evaluation &ev)
{
    auto const supply =
        BOOST_OUTCOME_TRYX(ev.observe_typed(ev.adapter().total_supply()));
    BOOST_OUTCOME_TRY(ev.ensure(
        supply == ev.pre().total_supply(),
        "totalSupply returned {} but the supply is {}",
        supply,
        ev.pre().total_supply()));
    return ev.ensure_unchanged();
}

void narrow_balance_query(Generator &gen, Assignment &a)
{
    if (gen.toss(0.3)) {
        make_null(a.sender, a.sender_balance);
    }
}

Result<void> balance_of_never_reverts(Evaluation &ev)
{
    auto const &a = ev.input();
    auto const observed = BOOST_OUTCOME_TRYX(
        ev.observe_raw(ev.adapter().raw_balance_of(a.sender)));
    return ensure_word_returned(ev, observed, "balanceOf");
}

Result<void> balance_of_matches(Evaluation &ev)
{
    auto const &a = ev.input();
    auto const balance =
        BOOST_OUTCOME_TRYX(ev.observe_typed(ev.adapter().balance_of(a.sender)));
    BOOST_OUTCOME_TRY(ev.ensure(
        balance == ev.pre().balance_of(a.sender),
        "balanceOf({}) returned {} but the balance is {}",
        a.sender,
        balance,
        ev.pre().balance_of(a.sender)));
    return ev.ensure_unchanged();
}

// Keep the three seeded balances from summing past MAX
void narrow_supply_bound(Generator &, Assignment &a)
{
    a.sender_balance = a.sender_balance >> 2;
    a.receiver_balance = a.receiver_balance >> 2;
    a.bystander_balance = a.bystander_balance >> 2;
}

Result<void> balances_bounded_by_supply(Evaluation &ev)
{
    auto const [sum, overflowed] = ev.pre().sum_of_balances();
    BOOST_OUTCOME_TRY(ev.require(!overflowed));

    auto const supply =
        BOOST_OUTCOME_TRYX(ev.observe_typed(ev.adapter().total_supply()));
    for (auto const &entry : ev.pre().balances()) {
        auto const &account = entry.first;
        auto const balance = BOOST_OUTCOME_TRYX(
            ev.observe_typed(ev.adapter().balance_of(account)));
        BOOST_OUTCOME_TRY(ev.ensure(
            balance <= supply,
            "balanceOf({}) is {} which exceeds totalSupply {}",
            account,
            balance,
            supply));
    }
    auto const null_balance = BOOST_OUTCOME_TRYX(
        ev.observe_typed(ev.adapter().balance_of(NULL_ADDRESS)));
    BOOST_OUTCOME_TRY(ev.ensure(
        null_balance == 0, "balanceOf(null) is {}", null_balance));
    return ev.ensure(
        sum == supply,
        "balances sum to {} but totalSupply is {}",
        sum,
        supply);
}

Result<void> allowance_never_reverts(Evaluation &ev)
{
    auto const &a = ev.input();
    auto const observed = BOOST_OUTCOME_TRYX(
        ev.observe_raw(ev.adapter().raw_allowance(a.sender, a.spender)));
    return ensure_word_returned(ev, observed, "allowance");
}

Result<void> allowance_matches(Evaluation &ev)
{
    auto const &a = ev.input();
    auto const allowance = BOOST_OUTCOME_TRYX(
        ev.observe_typed(ev.adapter().allowance(a.sender, a.spender)));
    BOOST_OUTCOME_TRY(ev.ensure(
        allowance == ev.pre().allowance_of(a.sender, a.spender),
        "allowance({}, {}) returned {} but the allowance is {}",
        a.sender,
        a.spender,
        allowance,
        ev.pre().allowance_of(a.sender, a.spender)));
    return ev.ensure_unchanged();
}

Property const PROPERTIES[] = {
    {"ERC20-STDPROP-01",
     "totalSupplyNeverReverts",
     Operation::TotalSupply,
     CallMode::Raw,
     "totalSupply never reverts and returns one word",
     nullptr,
     any_assignment,
     total_supply_never_reverts},
    {"ERC20-STDPROP-02",
     "totalSupplyMatchesState",
     Operation::TotalSupply,
     CallMode::Typed,
     "totalSupply returns the supply and changes nothing",
     nullptr,
     any_assignment,
     total_supply_matches},
    {"ERC20-STDPROP-03",
     "balanceOfNeverReverts",
     Operation::BalanceOf,
     CallMode::Raw,
     "balanceOf never reverts, for any address including null",
     narrow_balance_query,
     any_assignment,
     balance_of_never_reverts},
    {"ERC20-STDPROP-04",
     "balanceOfMatchesState",
     Operation::BalanceOf,
     CallMode::Typed,
     "balanceOf returns the balance and changes nothing",
     nullptr,
     any_assignment,
     balance_of_matches},
    {"ERC20-STDPROP-05",
     "balanceBoundedBySupply",
     Operation::BalanceOf,
     CallMode::Typed,
     "every balance is at most totalSupply, balanceOf(null) is zero and "
     "the balances sum to totalSupply",
     narrow_supply_bound,
     any_assignment,
     balances_bounded_by_supply},
    {"ERC20-STDPROP-06",
     "allowanceNeverReverts",
     Operation::Allowance,
     CallMode::Raw,
     "allowance never reverts",
     nullptr,
     any_assignment,
     allowance_never_reverts},
    {"ERC20-STDPROP-07",
     "allowanceMatchesState",
     Operation::Allowance,
     CallMode::Typed,
     "allowance returns the allowance and changes nothing",
     nullptr,
     any_assignment,
     allowance_matches},
};

STDPROP_ANONYMOUS_NAMESPACE_END

STDPROP_NAMESPACE_BEGIN

std::span<Property const> read_properties()
{
    return PROPERTIES;
}

STDPROP_NAMESPACE_END
