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

#include <stdprop/core/fmt/address_fmt.hpp>
#include <stdprop/core/fmt/int_fmt.hpp>
#include <stdprop/explore/report.hpp>
#include <stdprop/property/assignment.hpp>
#include <stdprop/property/evaluation.hpp>
#include <stdprop/token/account_state.hpp>
#include <stdprop/token/call_outcome.hpp>

#include <fmt/format.h>

#include <magic_enum.hpp>

#include <iterator>
#include <string>
#include <string_view>

STDPROP_ANONYMOUS_NAMESPACE_BEGIN

void append_state(
    std::string &out, std::string_view const label, AccountState const &state)
{
    auto it = std::back_inserter(out);
    fmt::format_to(it, "  {}: totalSupply={}\n", label, state.total_supply());
    for (auto const &[account, balance] : state.balances()) {
        fmt::format_to(it, "    balance {} = {}\n", account, balance);
    }
    for (auto const &[key, allowance] : state.allowances()) {
        fmt::format_to(
            it,
            "    allowance {} -> {} = {}\n",
            key.first,
            key.second,
            allowance);
    }
}

STDPROP_ANONYMOUS_NAMESPACE_END

STDPROP_NAMESPACE_BEGIN

std::string_view to_string(Verdict const verdict)
{
    return magic_enum::enum_name(verdict);
}

std::string_view to_string(InconclusiveReason const reason)
{
    return magic_enum::enum_name(reason);
}

std::string summarize(PropertyReport const &report)
{
    auto out = fmt::format(
        "{} {:<40} {:<12}",
        report.id,
        report.name,
        to_string(report.verdict));
    switch (report.verdict) {
    case Verdict::Fail:
        fmt::format_to(
            std::back_inserter(out),
            " {} after {} evaluations, {} shrink steps",
            to_string(report.defect),
            report.evaluations,
            report.shrink_steps);
        break;
    case Verdict::Inconclusive:
        fmt::format_to(
            std::back_inserter(out),
            " {} ({} evaluations, {} discards, {} step overruns)",
            to_string(report.reason),
            report.evaluations,
            report.discards,
            report.step_overruns);
        break;
    case Verdict::Pass:
        fmt::format_to(
            std::back_inserter(out),
            " {} evaluations, {} discards",
            report.evaluations,
            report.discards);
        break;
    }
    return out;
}

std::string describe(PropertyReport const &report)
{
    auto out = summarize(report);
    if (!report.counterexample.has_value()) {
        return out;
    }
    auto const &[assignment, record] = *report.counterexample;
    auto it = std::back_inserter(out);
    fmt::format_to(it, "\n  witness: {}\n", assignment);
    fmt::format_to(it, "  message: {}\n", record.message);
    if (record.observed.has_value()) {
        fmt::format_to(it, "  observed: {}\n", to_string(*record.observed));
    }
    if (record.pre.has_value()) {
        append_state(out, "pre", *record.pre);
    }
    if (record.post.has_value()) {
        append_state(out, "post", *record.post);
    }
    fmt::format_to(std::back_inserter(out), "  steps: {}", record.steps);
    return out;
}

STDPROP_NAMESPACE_END
