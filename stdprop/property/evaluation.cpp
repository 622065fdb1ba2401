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
#include <stdprop/core/assert.h>
#include <stdprop/core/fmt/address_fmt.hpp>
#include <stdprop/core/fmt/int_fmt.hpp>
#include <stdprop/core/int.hpp>
#include <stdprop/core/likely.h>
#include <stdprop/core/result.hpp>
#include <stdprop/property/assignment.hpp>
#include <stdprop/property/evaluation.hpp>
#include <stdprop/property/evaluation_error.hpp>
#include <stdprop/property/property.hpp>
#include <stdprop/token/account_state.hpp>
#include <stdprop/token/call_outcome.hpp>
#include <stdprop/token/subject_error.hpp>
#include <stdprop/token/token_subject.hpp>

#include <boost/outcome/success_failure.hpp>
#include <boost/outcome/try.hpp>

#include <fmt/format.h>

#include <magic_enum.hpp>

#include <cstddef>
#include <string>
#include <string_view>
#include <utility>

STDPROP_NAMESPACE_BEGIN

std::string_view to_string(DefectKind const kind)
{
    return magic_enum::enum_name(kind);
}

Evaluation::Evaluation(
    TokenSubject &subject, Assignment const &input, size_t const max_steps)
    : subject_{subject}
    , input_{input}
    , adapter_{subject, max_steps}
{
}

Result<void> Evaluation::fail(DefectKind const kind, std::string message)
{
    STDPROP_ASSERT(kind != DefectKind::None);
    record_.defect = kind;
    record_.message = std::move(message);
    return EvaluationError::PropertyViolation;
}

Result<void> Evaluation::setup_failed(Result<void> const &res)
{
    STDPROP_ASSERT(res.has_error());
    if (res.assume_error() == SubjectError::StepBudgetExceeded) {
        return EvaluationError::StepBudgetExceeded;
    }
    return EvaluationError::PreconditionUnsatisfied;
}

Result<void> Evaluation::mint(Address const &to, uint256_t const &amount)
{
    if (amount == 0) {
        return outcome::success();
    }
    auto const res = adapter_.mint(to, amount);
    if (STDPROP_UNLIKELY(res.has_error())) {
        return setup_failed(res);
    }
    return outcome::success();
}

Result<void> Evaluation::approve(
    Address const &owner, Address const &spender, uint256_t const &amount)
{
    auto const res = adapter_.raw_approve(owner, spender, amount);
    if (STDPROP_UNLIKELY(res.has_error())) {
        return EvaluationError::StepBudgetExceeded;
    }
    auto const &observed = res.assume_value();
    if (observed.is_reverted() || observed.returned_false()) {
        return EvaluationError::PreconditionUnsatisfied;
    }
    return outcome::success();
}

Result<void> Evaluation::seed()
{
    BOOST_OUTCOME_TRY(mint(input_.sender, input_.sender_balance));
    BOOST_OUTCOME_TRY(mint(input_.receiver, input_.receiver_balance));
    BOOST_OUTCOME_TRY(mint(input_.bystander, input_.bystander_balance));
    if (input_.allowance != 0) {
        BOOST_OUTCOME_TRY(
            approve(input_.sender, input_.spender, input_.allowance));
    }
    record_.pre = subject_.state();
    return outcome::success();
}

Result<CallOutcome> Evaluation::observe_raw(Result<CallOutcome> res)
{
    if (STDPROP_UNLIKELY(res.has_error())) {
        // raw calls only fail when out of steps
        STDPROP_ASSERT(res.assume_error() == SubjectError::StepBudgetExceeded);
        return EvaluationError::StepBudgetExceeded;
    }
    record_.observed = res.assume_value();
    return res;
}

Result<void> Evaluation::require(bool const holds)
{
    if (STDPROP_UNLIKELY(!holds)) {
        return EvaluationError::PreconditionUnsatisfied;
    }
    return outcome::success();
}

Result<void> Evaluation::ensure_reverted(
    CallOutcome const &observed, std::string_view const what)
{
    if (observed.returned_false()) {
        return fail(
            DefectKind::CompletedFalse,
            fmt::format("{} returned false instead of reverting", what));
    }
    BOOST_OUTCOME_TRY(ensure(
        observed.is_reverted(),
        "{} completed instead of reverting: {}",
        what,
        to_string(observed)));
    return ensure(post() == pre(), "{} reverted but changed the state", what);
}

Result<void> Evaluation::ensure_not_false(
    CallOutcome const &observed, std::string_view const what)
{
    if (observed.returned_false()) {
        return fail(
            DefectKind::CompletedFalse,
            fmt::format("{} completed with a false return", what));
    }
    return outcome::success();
}

Result<void> Evaluation::ensure_unchanged()
{
    auto const balances = balance_changes(pre(), post());
    if (!balances.empty()) {
        auto const &[account, values] = *balances.begin();
        return fail(
            DefectKind::PropertyViolation,
            fmt::format(
                "balance of {} changed from {} to {}",
                account,
                values.first,
                values.second));
    }
    auto const allowances = allowance_changes(pre(), post());
    if (!allowances.empty()) {
        auto const &[key, values] = *allowances.begin();
        return fail(
            DefectKind::PropertyViolation,
            fmt::format(
                "allowance of {} for {} changed from {} to {}",
                key.first,
                key.second,
                values.first,
                values.second));
    }
    return ensure(
        post().total_supply() == pre().total_supply(),
        "total supply changed from {} to {}",
        pre().total_supply(),
        post().total_supply());
}

Result<void> Evaluation::ensure_supply_conserved()
{
    auto const [pre_sum, pre_overflowed] = pre().sum_of_balances();
    if (pre_overflowed || pre_sum != pre().total_supply()) {
        return outcome::success();
    }

    auto const &state = post();
    BOOST_OUTCOME_TRY(ensure(
        state.balance_of(NULL_ADDRESS) == 0,
        "null address holds {} after the call",
        state.balance_of(NULL_ADDRESS)));
    auto const [sum, overflowed] = state.sum_of_balances();
    BOOST_OUTCOME_TRY(ensure(
        !overflowed,
        "balances sum past MAX after the call, total supply is {}",
        state.total_supply()));
    return ensure(
        sum == state.total_supply(),
        "balances sum to {} after the call but the total supply is {}",
        sum,
        state.total_supply());
}

AccountState const &Evaluation::pre() const
{
    STDPROP_ASSERT_MSG(record_.pre.has_value(), "pre snapshot not taken");
    return *record_.pre;
}

EvaluationRecord Evaluation::take_record()
{
    if (record_.pre.has_value()) {
        record_.post = subject_.state();
    }
    record_.steps = adapter_.steps();
    return std::move(record_);
}

Result<void> evaluate(
    Property const &property, SubjectFactory const &factory,
    Assignment const &input, size_t const max_steps, EvaluationRecord &record)
{
    if (!property.precondition(input)) {
        record = {};
        return EvaluationError::PreconditionUnsatisfied;
    }

    auto const subject = factory();
    STDPROP_ASSERT(subject != nullptr);
    Evaluation ev{*subject, input, max_steps};
    auto res = [&]() -> Result<void> {
        BOOST_OUTCOME_TRY(ev.seed());
        BOOST_OUTCOME_TRY(property.evaluate(ev));
        if (is_mutating(property.operation)) {
            return ev.ensure_supply_conserved();
        }
        return outcome::success();
    }();
    record = ev.take_record();
    return res;
}

STDPROP_NAMESPACE_END
