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
#include <stdprop/token/account_state.hpp>
#include <stdprop/token/call_outcome.hpp>

#include <boost/outcome/try.hpp>

#include <span>

// The spender is the caller and moves the sender's tokens to the receiver.

STDPROP_ANONYMOUS_NAMESPACE_BEGIN

Result<CallOutcome> raw_transfer_from(Evaluation &ev)
{
    auto const &a = ev.input();
    return ev.observe_raw(ev.adapter().raw_transfer_from(
        a.spender, a.sender, a.receiver, a.amount));
}

Result<bool> typed_transfer_from(Evaluation &ev)
{
    auto const &a = ev.input();
    return ev.observe_typed(
        ev.adapter().transfer_from(a.spender, a.sender, a.receiver, a.amount));
}

// Completable transferFrom between non-null parties
void make_spendable(Generator &gen, Assignment &a)
{
    make_non_null(gen, a.spender);
    make_transferable(gen, a);
    make_covered(gen, a);
}

bool parties_non_null(Assignment const &a)
{
    return all_non_null({a.sender, a.receiver, a.spender});
}

bool distinct_parties(Assignment const &a)
{
    return parties_non_null(a) && a.sender != a.receiver;
}

void narrow_from_null(Generator &gen, Assignment &a)
{
    make_non_null(gen, a.spender);
    make_null(a.sender, a.sender_balance);
    if (gen.toss(0.5)) {
        a.amount = 0;
    }
    if (gen.toss(0.5)) {
        make_covered(gen, a);
    }
}

bool from_null_precondition(Assignment const &a)
{
    return is_null(a.sender) && !is_null(a.spender);
}

Result<void> transfer_from_null_source_reverts(Evaluation &ev)
{
    auto const observed = BOOST_OUTCOME_TRYX(raw_transfer_from(ev));
    return ev.ensure_reverted(observed, "transferFrom from the null address");
}

void narrow_to_null(Generator &gen, Assignment &a)
{
    make_non_null(gen, a.sender);
    make_non_null(gen, a.spender);
    make_null(a.receiver, a.receiver_balance);
    make_affordable(gen, a);
    make_covered(gen, a);
}

bool to_null_precondition(Assignment const &a)
{
    return all_non_null({a.sender, a.spender}) && is_null(a.receiver);
}

Result<void> transfer_from_to_null_reverts(Evaluation &ev)
{
    auto const observed = BOOST_OUTCOME_TRYX(raw_transfer_from(ev));
    return ev.ensure_reverted(observed, "transferFrom to the null address");
}

void narrow_insufficient_balance(Generator &gen, Assignment &a)
{
    make_non_null(gen, a.sender);
    make_non_null(gen, a.receiver);
    make_non_null(gen, a.spender);
    if (a.sender_balance == MAX_UINT256) {
        a.sender_balance = gen.gen_bound_biased_uint256(0, MAX_UINT256 - 1);
    }
    if (a.amount <= a.sender_balance) {
        a.amount =
            gen.gen_bound_biased_uint256(a.sender_balance + 1, MAX_UINT256);
    }
    make_covered(gen, a);
}

Result<void> transfer_from_insufficient_balance_reverts(Evaluation &ev)
{
    auto const &a = ev.input();
    auto const &pre = ev.pre();
    BOOST_OUTCOME_TRY(ev.require(a.amount > pre.balance_of(a.sender)));
    BOOST_OUTCOME_TRY(
        ev.require(pre.allowance_of(a.sender, a.spender) >= a.amount));
    auto const observed = BOOST_OUTCOME_TRYX(raw_transfer_from(ev));
    return ev.ensure_reverted(observed, "transferFrom exceeding the balance");
}

// Only the allowance stands in the way
void narrow_insufficient_allowance(Generator &gen, Assignment &a)
{
    make_non_null(gen, a.sender);
    make_non_null(gen, a.receiver);
    make_non_null(gen, a.spender);
    if (a.allowance == MAX_UINT256) {
        a.allowance = gen.gen_bound_biased_uint256(0, MAX_UINT256 - 1);
    }
    if (a.amount <= a.allowance) {
        a.amount = gen.gen_bound_biased_uint256(a.allowance + 1, MAX_UINT256);
    }
    if (a.sender_balance < a.amount) {
        a.sender_balance = gen.gen_bound_biased_uint256(a.amount, MAX_UINT256);
    }
    make_creditable(gen, a);
}

Result<void> transfer_from_insufficient_allowance_reverts(Evaluation &ev)
{
    auto const &a = ev.input();
    BOOST_OUTCOME_TRY(
        ev.require(a.amount > ev.pre().allowance_of(a.sender, a.spender)));
    auto const observed = BOOST_OUTCOME_TRYX(raw_transfer_from(ev));
    return ev.ensure_reverted(observed, "transferFrom exceeding the allowance");
}

Result<void> completed_transfer_from_returns_true(Evaluation &ev)
{
    auto const observed = BOOST_OUTCOME_TRYX(raw_transfer_from(ev));
    BOOST_OUTCOME_TRY(ev.require(observed.is_completed()));
    return ev.ensure(
        observed.returned_true(),
        "transferFrom completed with {}",
        to_string(observed));
}

void narrow_receiver_overflow(Generator &gen, Assignment &a)
{
    make_receiver_overflow(gen, a);
    make_non_null(gen, a.spender);
    make_covered(gen, a);
}

Result<void> transfer_from_receiver_overflow_reverts(Evaluation &ev)
{
    auto const &a = ev.input();
    auto const &pre = ev.pre();
    BOOST_OUTCOME_TRY(ev.require(a.amount <= pre.balance_of(a.sender)));
    BOOST_OUTCOME_TRY(
        ev.require(pre.allowance_of(a.sender, a.spender) >= a.amount));
    BOOST_OUTCOME_TRY(
        ev.require(add(pre.balance_of(a.receiver), a.amount).second));
    auto const observed = BOOST_OUTCOME_TRYX(raw_transfer_from(ev));
    return ev.ensure_reverted(
        observed, "transferFrom overflowing the receiver balance");
}

void narrow_zero_amount(Generator &gen, Assignment &a)
{
    make_non_null(gen, a.sender);
    make_non_null(gen, a.receiver);
    make_non_null(gen, a.spender);
    a.amount = 0;
}

bool zero_amount_precondition(Assignment const &a)
{
    return parties_non_null(a) && a.amount == 0;
}

Result<void> zero_transfer_from_is_neutral(Evaluation &ev)
{
    auto const observed = BOOST_OUTCOME_TRYX(raw_transfer_from(ev));
    BOOST_OUTCOME_TRY(ev.ensure(
        observed.returned_true(),
        "zero amount transferFrom ended with {}",
        to_string(observed)));
    return ev.ensure_unchanged();
}

void narrow_self_transfer(Generator &gen, Assignment &a)
{
    make_non_null(gen, a.sender);
    make_non_null(gen, a.spender);
    a.receiver = a.sender;
    make_affordable(gen, a);
    make_covered(gen, a);
}

bool self_transfer_precondition(Assignment const &a)
{
    return all_non_null({a.sender, a.spender}) && a.sender == a.receiver;
}

Result<void> self_transfer_from_keeps_balance(Evaluation &ev)
{
    auto const &a = ev.input();
    auto const ok = BOOST_OUTCOME_TRYX(typed_transfer_from(ev));
    BOOST_OUTCOME_TRY(ev.ensure(ok, "self transferFrom returned false"));
    return ev.ensure(
        ev.post().balance_of(a.sender) == ev.pre().balance_of(a.sender),
        "transferFrom of {} from {} to itself moved the balance from {} to {}",
        a.amount,
        a.sender,
        ev.pre().balance_of(a.sender),
        ev.post().balance_of(a.sender));
}

void narrow_distinct_transfer(Generator &gen, Assignment &a)
{
    make_non_null(gen, a.sender);
    if (a.receiver == a.sender || is_null(a.receiver)) {
        a.receiver = gen.gen_distinct_address(a.sender);
    }
    make_spendable(gen, a);
}

Result<void> transfer_from_moves_exact_amount(Evaluation &ev)
{
    auto const &a = ev.input();
    auto const &pre = ev.pre();
    auto const ok = BOOST_OUTCOME_TRYX(typed_transfer_from(ev));
    BOOST_OUTCOME_TRY(ev.require(ok));

    auto const debited = checked_sub(pre.balance_of(a.sender), a.amount);
    auto const credited = checked_add(pre.balance_of(a.receiver), a.amount);
    BOOST_OUTCOME_TRY(ev.ensure(
        debited.has_value() && credited.has_value(),
        "transferFrom of {} completed but cannot be applied exactly",
        a.amount));
    BOOST_OUTCOME_TRY(ev.ensure(
        ev.post().balance_of(a.sender) == *debited,
        "source balance is {}, expected {}",
        ev.post().balance_of(a.sender),
        *debited));
    return ev.ensure(
        ev.post().balance_of(a.receiver) == *credited,
        "destination balance is {}, expected {}",
        ev.post().balance_of(a.receiver),
        *credited);
}

// Finite allowance, which excludes MAX
void narrow_finite_allowance(Generator &gen, Assignment &a)
{
    make_spendable(gen, a);
    if (a.amount == MAX_UINT256) {
        a.amount = gen.gen_bound_biased_uint256(0, MAX_UINT256 - 1);
    }
    if (a.allowance == MAX_UINT256 || a.allowance < a.amount) {
        a.allowance = gen.gen_bound_biased_uint256(a.amount, MAX_UINT256 - 1);
    }
}

Result<void> transfer_from_consumes_allowance(Evaluation &ev)
{
    auto const &a = ev.input();
    auto const allowance = ev.pre().allowance_of(a.sender, a.spender);
    BOOST_OUTCOME_TRY(ev.require(allowance < MAX_UINT256));
    auto const ok = BOOST_OUTCOME_TRYX(typed_transfer_from(ev));
    BOOST_OUTCOME_TRY(ev.require(ok));

    auto const expected = checked_sub(allowance, a.amount);
    BOOST_OUTCOME_TRY(ev.ensure(
        expected.has_value(),
        "transferFrom of {} completed with an allowance of {}",
        a.amount,
        allowance));
    auto const after = ev.post().allowance_of(a.sender, a.spender);
    return ev.ensure(
        after == *expected,
        "allowance went from {} to {} after spending {}",
        allowance,
        after,
        a.amount);
}

void narrow_unlimited_allowance(Generator &gen, Assignment &a)
{
    make_non_null(gen, a.sender);
    if (a.receiver == a.sender || is_null(a.receiver)) {
        a.receiver = gen.gen_distinct_address(a.sender);
    }
    make_spendable(gen, a);
    a.allowance = MAX_UINT256;
}

bool unlimited_allowance_precondition(Assignment const &a)
{
    return distinct_parties(a) && a.allowance == MAX_UINT256;
}

// Tokens may or may not treat MAX as unlimited; both are accepted
Result<void> transfer_from_unlimited_allowance(Evaluation &ev)
{
    auto const &a = ev.input();
    auto const &pre = ev.pre();
    BOOST_OUTCOME_TRY(
        ev.require(pre.allowance_of(a.sender, a.spender) == MAX_UINT256));
    BOOST_OUTCOME_TRY(ev.require(a.amount <= pre.balance_of(a.sender)));
    auto const credited = checked_add(pre.balance_of(a.receiver), a.amount);
    BOOST_OUTCOME_TRY(ev.require(credited.has_value()));

    auto const observed = BOOST_OUTCOME_TRYX(raw_transfer_from(ev));
    BOOST_OUTCOME_TRY(ev.ensure(
        observed.returned_true(),
        "transferFrom under an unlimited allowance ended with {}",
        to_string(observed)));
    BOOST_OUTCOME_TRY(ev.ensure(
        ev.post().balance_of(a.sender) == pre.balance_of(a.sender) - a.amount &&
            ev.post().balance_of(a.receiver) == *credited,
        "balances moved from ({}, {}) to ({}, {}) for an amount of {}",
        pre.balance_of(a.sender),
        pre.balance_of(a.receiver),
        ev.post().balance_of(a.sender),
        ev.post().balance_of(a.receiver),
        a.amount));
    auto const after = ev.post().allowance_of(a.sender, a.spender);
    return ev.ensure(
        after == MAX_UINT256 || after == MAX_UINT256 - a.amount,
        "unlimited allowance became {} after spending {}",
        after,
        a.amount);
}

void narrow_change_set(Generator &gen, Assignment &a)
{
    make_spendable(gen, a);
    if (a.bystander == a.sender || a.bystander == a.receiver ||
        is_null(a.bystander)) {
        a.bystander = gen.gen_distinct_address(a.sender, a.receiver);
    }
}

bool change_set_precondition(Assignment const &a)
{
    return parties_non_null(a) && !is_null(a.bystander) &&
           a.bystander != a.sender && a.bystander != a.receiver;
}

Result<void> transfer_from_change_set(Evaluation &ev)
{
    auto const &a = ev.input();
    BOOST_OUTCOME_TRY(typed_transfer_from(ev));
    for (auto const &[account, values] :
         balance_changes(ev.pre(), ev.post())) {
        BOOST_OUTCOME_TRY(ev.ensure(
            account == a.sender || account == a.receiver,
            "transferFrom changed the balance of {} from {} to {}",
            account,
            values.first,
            values.second));
    }
    for (auto const &[key, values] :
         allowance_changes(ev.pre(), ev.post())) {
        BOOST_OUTCOME_TRY(ev.ensure(
            key == AllowanceKey{a.sender, a.spender},
            "transferFrom changed the allowance of {} for {} from {} to {}",
            key.first,
            key.second,
            values.first,
            values.second));
    }
    return ev.ensure(
        ev.post().total_supply() == ev.pre().total_supply(),
        "transferFrom changed the total supply from {} to {}",
        ev.pre().total_supply(),
        ev.post().total_supply());
}

Result<void> transfer_from_never_returns_false(Evaluation &ev)
{
    auto const observed = BOOST_OUTCOME_TRYX(raw_transfer_from(ev));
    return ev.ensure_not_false(observed, "transferFrom");
}

Property const PROPERTIES[] = {
    {"ERC20-STDPROP-19",
     "transferFromZeroAddressReverts",
     Operation::TransferFrom,
     CallMode::Raw,
     "transferFrom with the null address as source reverts",
     narrow_from_null,
     from_null_precondition,
     transfer_from_null_source_reverts},
    {"ERC20-STDPROP-20",
     "transferFromToZeroAddressReverts",
     Operation::TransferFrom,
     CallMode::Raw,
     "transferFrom to the null address reverts and changes nothing",
     narrow_to_null,
     to_null_precondition,
     transfer_from_to_null_reverts},
    {"ERC20-STDPROP-21",
     "transferFromInsufficientBalanceReverts",
     Operation::TransferFrom,
     CallMode::Raw,
     "transferFrom of more than the source balance reverts even when the "
     "allowance covers it",
     narrow_insufficient_balance,
     parties_non_null,
     transfer_from_insufficient_balance_reverts},
    {"ERC20-STDPROP-22",
     "transferFromInsufficientAllowanceReverts",
     Operation::TransferFrom,
     CallMode::Raw,
     "transferFrom of more than the allowance reverts and leaves the "
     "allowance unchanged",
     narrow_insufficient_allowance,
     parties_non_null,
     transfer_from_insufficient_allowance_reverts},
    {"ERC20-STDPROP-23",
     "transferFromReturnsTrue",
     Operation::TransferFrom,
     CallMode::Raw,
     "a transferFrom that completes returns true",
     make_spendable,
     any_assignment,
     completed_transfer_from_returns_true},
    {"ERC20-STDPROP-24",
     "transferFromReceiverOverflowReverts",
     Operation::TransferFrom,
     CallMode::Raw,
     "transferFrom that would overflow the destination balance reverts",
     narrow_receiver_overflow,
     distinct_parties,
     transfer_from_receiver_overflow_reverts},
    {"ERC20-STDPROP-25",
     "transferFromZeroAmount",
     Operation::TransferFrom,
     CallMode::Raw,
     "transferFrom of zero returns true and changes nothing",
     narrow_zero_amount,
     zero_amount_precondition,
     zero_transfer_from_is_neutral},
    {"ERC20-STDPROP-26",
     "transferFromSelf",
     Operation::TransferFrom,
     CallMode::Typed,
     "transferFrom with source equal to destination leaves the balance "
     "unchanged",
     narrow_self_transfer,
     self_transfer_precondition,
     self_transfer_from_keeps_balance},
    {"ERC20-STDPROP-27",
     "transferFromExactAmounts",
     Operation::TransferFrom,
     CallMode::Typed,
     "transferFrom debits the source and credits the destination by "
     "exactly the amount",
     narrow_distinct_transfer,
     distinct_parties,
     transfer_from_moves_exact_amount},
    {"ERC20-STDPROP-28",
     "transferFromConsumesAllowance",
     Operation::TransferFrom,
     CallMode::Typed,
     "transferFrom decreases a finite allowance by exactly the amount",
     narrow_finite_allowance,
     parties_non_null,
     transfer_from_consumes_allowance},
    {"ERC20-STDPROP-29",
     "transferFromUnlimitedAllowance",
     Operation::TransferFrom,
     CallMode::Raw,
     "transferFrom under a MAX allowance returns true, moves the balances "
     "and leaves the allowance at MAX or MAX minus the amount",
     narrow_unlimited_allowance,
     unlimited_allowance_precondition,
     transfer_from_unlimited_allowance},
    {"ERC20-STDPROP-30",
     "transferFromChangeState",
     Operation::TransferFrom,
     CallMode::Typed,
     "transferFrom changes only the source and destination balances and "
     "the spender allowance over the source",
     narrow_change_set,
     change_set_precondition,
     transfer_from_change_set},
    {"ERC20-STDPROP-31",
     "transferFromNeverReturnsFalse",
     Operation::TransferFrom,
     CallMode::Raw,
     "transferFrom either reverts or returns true",
     nullptr,
     any_assignment,
     transfer_from_never_returns_false},
};

STDPROP_ANONYMOUS_NAMESPACE_END

STDPROP_NAMESPACE_BEGIN

std::span<Property const> transfer_from_properties()
{
    return PROPERTIES;
}

STDPROP_NAMESPACE_END
