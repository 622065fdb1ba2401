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

#include <stdprop/core/basic_formatter.hpp>
#include <stdprop/core/config.hpp>
#include <stdprop/property/assignment.hpp>
#include <stdprop/property/evaluation.hpp>

#include <fmt/format.h>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

STDPROP_NAMESPACE_BEGIN

enum class Verdict : uint8_t
{
    Pass,
    Fail,
    Inconclusive,
};

enum class InconclusiveReason : uint8_t
{
    None,
    PreconditionUnsatisfiable,
    // time budget of the property, or the step budget of an evaluation
    Timeout,
};

std::string_view to_string(Verdict);
std::string_view to_string(InconclusiveReason);

struct Counterexample
{
    Assignment assignment;
    EvaluationRecord record;
};

struct PropertyReport
{
    std::string_view id{};
    std::string_view name{};
    Verdict verdict{Verdict::Pass};
    InconclusiveReason reason{InconclusiveReason::None};
    DefectKind defect{DefectKind::None};
    size_t evaluations{0};
    size_t discards{0};
    size_t step_overruns{0};
    size_t shrink_steps{0};
    std::chrono::milliseconds elapsed{0};
    std::optional<Counterexample> counterexample{};
};

// One line per property
std::string summarize(PropertyReport const &);

// Summary followed by the witness, the observed outcome and the state
// before and after the call under test
std::string describe(PropertyReport const &);

STDPROP_NAMESPACE_END

template <>
struct fmt::formatter<stdprop::PropertyReport> : public stdprop::basic_formatter
{
    template <typename FormatContext>
    auto format(stdprop::PropertyReport const &report, FormatContext &ctx) const
    {
        return fmt::format_to(ctx.out(), "{}", stdprop::describe(report));
    }
};
