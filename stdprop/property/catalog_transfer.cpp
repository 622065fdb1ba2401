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

#include <boost/outcome/success_failure.hpp>
#include <boost/outcome/try.hpp>

#include <span>

STDPROP_ANONYMOUS_NAMESPACE_BEGIN

Result<CallOutcome> raw_transfer(Evaluation &ev)
{
    auto const &a = ev.input();
    return ev.observe_raw(
        ev.adapter().raw_transfer(a.sender, a.receiver, a.amount));
}

Result<bool> typed_transfer(Evaluation &ev)
{
    auto const &a = ev.input();
    return ev.observe_typed(
        ev.adapter().transfer(a.sender, a.receiver, a.amount));
}

void narrow_to_null(Generator &gen, Assignment &a)
{
    make_non_null(gen, a.sender);
    make_null(a.receiver, a.receiver_balance);
    if (gen.toss(0.7)) {
        make_affordable(gen, a);
    }
}

bool to_null_precondition(Assignment const &a)
{
    return !is_null(a.sender) && is_null(a.receiver);
}

Result<void> transfer_to_null_reverts(Evaluation &ev)
{
    auto const observed = BOOST_OUTCOME_TRYX(raw_transfer(ev));
    return ev.ensure_reverted(observed, "transfer to the null address");
}

void narrow_from_null(Generator &gen, Assignment &a)
{
    make_null(a.sender, a.sender_balance);
    if (gen.toss(0.5)) {
        a.amount = 0;
    }
}

bool from_null_precondition(Assignment const &a)
{
    return is_null(a.sender);
}

Result<void> transfer_from_null_reverts(Evaluation &ev)
{
    auto const observed = BOOST_OUTCOME_TRYX(raw_transfer(ev));
    return ev.ensure_reverted(observed, "transfer from the null address");
}

Result<void> completed_transfer_returns_true(Evaluation &ev)
{
    auto const observed = BOOST_OUTCOME_TRYX(raw_transfer(ev));
    BOOST_OUTCOME_TRY(ev.require(observed.is_completed()));
    return ev.ensure(
        observed.returned_true(),
        "transfer completed with {}",
        to_string(observed));
}

void narrow_insufficient_balance(Generator &gen, Assignment &a)
{
    make_non_null(gen, a.sender);
    make_non_null(gen, a.receiver);
    if (a.sender_balance == MAX_UINT256) {
        a.sender_balance = gen.gen_bound_biased_uint256(0, MAX_UINT256 - 1);
    }
    if (a.amount <= a.sender_balance) {
        a.amount =
            gen.gen_bound_biased_uint256(a.sender_balance + 1, MAX_UINT256);
    }
}

bool sender_receiver_non_null(Assignment const &a)
{
    return all_non_null({a.sender, a.receiver});
}

Result<void> transfer_insufficient_balance_reverts(Evaluation &ev)
{
    auto const &a = ev.input();
    BOOST_OUTCOME_TRY(ev.require(a.amount > ev.pre().balance_of(a.sender)));
    auto const observed = BOOST_OUTCOME_TRYX(raw_transfer(ev));
    return ev.ensure_reverted(observed, "transfer exceeding the balance");
}

bool distinct_sender_receiver(Assignment const &a)
{
    return all_non_null({a.sender, a.receiver}) && a.sender != a.receiver;
}

Result<void> transfer_receiver_overflow_reverts(Evaluation &ev)
{
    auto const &a = ev.input();
    auto const &pre = ev.pre();
    BOOST_OUTCOME_TRY(ev.require(a.amount <= pre.balance_of(a.sender)));
    BOOST_OUTCOME_TRY(
        ev.require(add(pre.balance_of(a.receiver), a.amount).second));
    auto const observed = BOOST_OUTCOME_TRYX(raw_transfer(ev));
    return ev.ensure_reverted(
        observed, "transfer overflowing the receiver balance");
}

void narrow_zero_amount(Generator &gen, Assignment &a)
{
    make_non_null(gen, a.sender);
    make_non_null(gen, a.receiver);
    a.amount = 0;
}

bool zero_amount_precondition(Assignment const &a)
{
    return sender_receiver_non_null(a) && a.amount == 0;
}

Result<void> zero_transfer_is_neutral(Evaluation &ev)
{
    auto const observed = BOOST_OUTCOME_TRYX(raw_transfer(ev));
    BOOST_OUTCOME_TRY(ev.ensure(
        observed.returned_true(),
        "zero amount transfer ended with {}",
        to_string(observed)));
    return ev.ensure_unchanged();
}

void narrow_self_transfer(Generator &gen, Assignment &a)
{
    make_non_null(gen, a.sender);
    a.receiver = a.sender;
    make_affordable(gen, a);
}

bool self_transfer_precondition(Assignment const &a)
{
    return !is_null(a.sender) && a.sender == a.receiver;
}

Result<void> self_transfer_keeps_balance(Evaluation &ev)
{
    auto const &a = ev.input();
    auto const ok = BOOST_OUTCOME_TRYX(typed_transfer(ev));
    BOOST_OUTCOME_TRY(ev.ensure(ok, "self-transfer returned false"));
    BOOST_OUTCOME_TRY(ev.ensure(
        ev.post().balance_of(a.sender) == ev.pre().balance_of(a.sender),
        "self-transfer of {} moved the balance of {} from {} to {}",
        a.amount,
        a.sender,
        ev.pre().balance_of(a.sender),
        ev.post().balance_of(a.sender)));
    return ev.ensure_unchanged();
}

void narrow_distinct_transfer(Generator &gen, Assignment &a)
{
    make_non_null(gen, a.sender);
    if (a.receiver == a.sender || is_null(a.receiver)) {
        a.receiver = gen.gen_distinct_address(a.sender);
    }
    make_transferable(gen, a);
}

Result<void> transfer_moves_exact_amount(Evaluation &ev)
{
    auto const &a = ev.input();
    auto const &pre = ev.pre();
    auto const ok = BOOST_OUTCOME_TRYX(typed_transfer(ev));
    BOOST_OUTCOME_TRY(ev.require(ok));

    auto const debited = checked_sub(pre.balance_of(a.sender), a.amount);
    auto const credited = checked_add(pre.balance_of(a.receiver), a.amount);
    BOOST_OUTCOME_TRY(ev.ensure(
        debited.has_value() && credited.has_value(),
        "transfer of {} completed but cannot be applied exactly",
        a.amount));
    BOOST_OUTCOME_TRY(ev.ensure(
        ev.post().balance_of(a.sender) == *debited,
        "sender balance is {}, expected {}",
        ev.post().balance_of(a.sender),
        *debited));
    return ev.ensure(
        ev.post().balance_of(a.receiver) == *credited,
        "receiver balance is {}, expected {}",
        ev.post().balance_of(a.receiver),
        *credited);
}

void narrow_isolation(Generator &gen, Assignment &a)
{
    make_transferable(gen, a);
    if (a.bystander == a.sender || a.bystander == a.receiver ||
        is_null(a.bystander)) {
        a.bystander = gen.gen_distinct_address(a.sender, a.receiver);
    }
}

bool isolation_precondition(Assignment const &a)
{
    return all_non_null({a.sender, a.receiver, a.bystander}) &&
           a.bystander != a.sender && a.bystander != a.receiver;
}

Result<void> transfer_isolates_others(Evaluation &ev)
{
    auto const &a = ev.input();
    BOOST_OUTCOME_TRY(typed_transfer(ev));
    for (auto const &[account, values] :
         balance_changes(ev.pre(), ev.post())) {
        BOOST_OUTCOME_TRY(ev.ensure(
            account == a.sender || account == a.receiver,
            "transfer changed the balance of {} from {} to {}",
            account,
            values.first,
            values.second));
    }
    return ev.ensure(
        ev.post().total_supply() == ev.pre().total_supply(),
        "transfer changed the total supply from {} to {}",
        ev.pre().total_supply(),
        ev.post().total_supply());
}

void narrow_allowance_untouched(Generator &gen, Assignment &a)
{
    make_transferable(gen, a);
    if (gen.toss(0.5)) {
        a.spender = a.receiver;
        if (a.allowance == 0) {
            a.allowance = gen.gen_bound_biased_uint256(1, MAX_UINT256);
        }
    }
}

Result<void> transfer_keeps_allowances(Evaluation &ev)
{
    BOOST_OUTCOME_TRY(typed_transfer(ev));
    auto const changes = allowance_changes(ev.pre(), ev.post());
    if (changes.empty()) {
        return outcome::success();
    }
    auto const &[key, values] = *changes.begin();
    return ev.ensure(
        false,
        "transfer changed the allowance of {} for {} from {} to {}",
        key.first,
        key.second,
        values.first,
        values.second);
}

Result<void> transfer_never_returns_false(Evaluation &ev)
{
    auto const observed = BOOST_OUTCOME_TRYX(raw_transfer(ev));
    return ev.ensure_not_false(observed, "transfer");
}

Property const PROPERTIES[] = {
    {"ERC20-STDPROP-08",
     "transferToZeroAddressReverts",
     Operation::Transfer,
     CallMode::Raw,
     "transfer to the null address reverts and changes nothing",
     narrow_to_null,
     to_null_precondition,
     transfer_to_null_reverts},
    {"ERC20-STDPROP-09",
     "transferFromZeroAddressReverts",
     Operation::Transfer,
     CallMode::Raw,
     "transfer called by the null address reverts",
     narrow_from_null,
     from_null_precondition,
     transfer_from_null_reverts},
    {"ERC20-STDPROP-10",
     "transferReturnsTrue",
     Operation::Transfer,
     CallMode::Raw,
     "a transfer that completes returns true",
     make_transferable,
     any_assignment,
     completed_transfer_returns_true},
    {"ERC20-STDPROP-11",
     "transferInsufficientBalanceReverts",
     Operation::Transfer,
     CallMode::Raw,
     "transfer of more than the sender balance reverts and changes nothing",
     narrow_insufficient_balance,
     sender_receiver_non_null,
     transfer_insufficient_balance_reverts},
    {"ERC20-STDPROP-12",
     "transferReceiverOverflowReverts",
     Operation::Transfer,
     CallMode::Raw,
     "transfer that would overflow the receiver balance reverts and "
     "changes nothing",
     make_receiver_overflow,
     distinct_sender_receiver,
     transfer_receiver_overflow_reverts},
    {"ERC20-STDPROP-13",
     "transferZeroAmount",
     Operation::Transfer,
     CallMode::Raw,
     "transfer of zero returns true and changes nothing",
     narrow_zero_amount,
     zero_amount_precondition,
     zero_transfer_is_neutral},
    {"ERC20-STDPROP-14",
     "transferSelf",
     Operation::Transfer,
     CallMode::Typed,
     "self-transfer returns true and leaves the balance unchanged",
     narrow_self_transfer,
     self_transfer_precondition,
     self_transfer_keeps_balance},
    {"ERC20-STDPROP-15",
     "transferExactAmounts",
     Operation::Transfer,
     CallMode::Typed,
     "transfer debits the sender and credits the receiver by exactly the "
     "amount",
     narrow_distinct_transfer,
     distinct_sender_receiver,
     transfer_moves_exact_amount},
    {"ERC20-STDPROP-16",
     "transferIsolation",
     Operation::Transfer,
     CallMode::Typed,
     "transfer changes no other balance and not the total supply",
     narrow_isolation,
     isolation_precondition,
     transfer_isolates_others},
    {"ERC20-STDPROP-17",
     "transferKeepsAllowances",
     Operation::Transfer,
     CallMode::Typed,
     "transfer changes no allowance",
     narrow_allowance_untouched,
     sender_receiver_non_null,
     transfer_keeps_allowances},
    {"ERC20-STDPROP-18",
     "transferNeverReturnsFalse",
     Operation::Transfer,
     CallMode::Raw,
     "transfer either reverts or returns true",
     nullptr,
     any_assignment,
     transfer_never_returns_false},
};

STDPROP_ANONYMOUS_NAMESPACE_END

STDPROP_NAMESPACE_BEGIN

std::span<Property const> transfer_properties()
{
    return PROPERTIES;
}

STDPROP_NAMESPACE_END
