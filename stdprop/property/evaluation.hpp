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

#include <stdprop/core/config.hpp>
#include <stdprop/core/likely.h>
#include <stdprop/core/result.hpp>
#include <stdprop/property/assignment.hpp>
#include <stdprop/property/evaluation_error.hpp>
#include <stdprop/property/property.hpp>
#include <stdprop/token/account_state.hpp>
#include <stdprop/token/call_outcome.hpp>
#include <stdprop/token/subject_adapter.hpp>
#include <stdprop/token/token_subject.hpp>

#include <boost/outcome/success_failure.hpp>

#include <fmt/format.h>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

STDPROP_NAMESPACE_BEGIN

enum class DefectKind : uint8_t
{
    None,
    PropertyViolation,
    // Completed with false where a revert is required
    CompletedFalse,
};

std::string_view to_string(DefectKind);

// Everything observed while evaluating one assignment
struct EvaluationRecord
{
    std::optional<AccountState> pre{};
    std::optional<AccountState> post{};
    std::optional<CallOutcome> observed{};
    std::string message{};
    DefectKind defect{DefectKind::None};
    size_t steps{0};
};

// One property applied to one assignment on a fresh subject.
//
// seed() performs the setup calls and takes the pre snapshot. The property
// then issues its calls through adapter() and hands every result to
// observe_raw() or observe_typed(), which record the outcome and translate
// adapter errors into evaluation errors. Failing checks return
// EvaluationError::PropertyViolation and leave the reason in the record.
class Evaluation
{
    TokenSubject &subject_;
    Assignment const &input_;
    SubjectAdapter adapter_;
    EvaluationRecord record_{};

    Result<void> fail(DefectKind, std::string message);
    Result<void> setup_failed(Result<void> const &);

public:
    Evaluation(TokenSubject &, Assignment const &, size_t max_steps);

    Assignment const &input() const noexcept
    {
        return input_;
    }

    SubjectAdapter &adapter() noexcept
    {
        return adapter_;
    }

    Result<void> mint(Address const &to, uint256_t const &amount);
    Result<void> approve(
        Address const &owner, Address const &spender, uint256_t const &amount);

    // Mints the sender, receiver and bystander balances, has the sender
    // approve the spender for the allowance, then snapshots the state.
    // Zero balances and a zero allowance are left out: the empty state
    // already holds them, and an approve(spender, 0) from a null owner or
    // to a null spender must not discard the input.
    Result<void> seed();

    Result<CallOutcome> observe_raw(Result<CallOutcome>);

    template <typename T>
    Result<T> observe_typed(Result<T> res)
    {
        if (STDPROP_UNLIKELY(res.has_error())) {
            auto const &error = res.assume_error();
            if (error == SubjectError::StepBudgetExceeded) {
                return EvaluationError::StepBudgetExceeded;
            }
            if (error == SubjectError::Reverted) {
                return EvaluationError::PreconditionUnsatisfied;
            }
            auto const message = error.message();
            return fail(
                       DefectKind::PropertyViolation,
                       fmt::format(
                           "typed call failed: {}",
                           std::string_view{message.c_str(), message.size()}))
                .as_failure();
        }
        return res;
    }

    Result<void> require(bool);

    template <typename... Args>
    Result<void>
    ensure(bool const holds, fmt::format_string<Args...> format, Args &&...args)
    {
        if (STDPROP_LIKELY(holds)) {
            return outcome::success();
        }
        return fail(
            DefectKind::PropertyViolation,
            fmt::format(format, std::forward<Args>(args)...));
    }

    // Reverted, and the revert left the state untouched
    Result<void> ensure_reverted(CallOutcome const &, std::string_view what);

    // Anything but a completed false return
    Result<void> ensure_not_false(CallOutcome const &, std::string_view what);

    Result<void> ensure_unchanged();

    // The balances of the current state sum to its supply and the null
    // address holds nothing, provided the seeded state was consistent
    Result<void> ensure_supply_conserved();

    AccountState const &pre() const;

    AccountState const &post() const
    {
        return subject_.state();
    }

    EvaluationRecord take_record();
};

// Runs one property on one assignment against a fresh subject. A mutating
// property that holds is followed by ensure_supply_conserved(). The record
// is filled in whatever the result.
Result<void> evaluate(
    Property const &, SubjectFactory const &, Assignment const &,
    size_t max_steps, EvaluationRecord &);

STDPROP_NAMESPACE_END
