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
#include <stdprop/explore/shrinker.hpp>
#include <stdprop/property/assignment.hpp>
#include <stdprop/property/evaluation.hpp>
#include <stdprop/property/evaluation_error.hpp>
#include <stdprop/property/generator.hpp>
#include <stdprop/property/property.hpp>
#include <stdprop/token/token_subject.hpp>

#include <fmt/format.h>

#include <quill/Quill.h>

#include <algorithm>
#include <array>
#include <cstddef>
#include <functional>
#include <set>
#include <string>
#include <utility>

STDPROP_ANONYMOUS_NAMESPACE_BEGIN

using AmountField = uint256_t Assignment::*;
using AddressField = Address Assignment::*;

constexpr std::array<std::pair<AmountField, char const *>, 6> AMOUNT_FIELDS = {
    {{&Assignment::amount, "amount"},
     {&Assignment::second_amount, "second_amount"},
     {&Assignment::sender_balance, "sender_balance"},
     {&Assignment::receiver_balance, "receiver_balance"},
     {&Assignment::bystander_balance, "bystander_balance"},
     {&Assignment::allowance, "allowance"}}};

constexpr std::array<std::pair<AddressField, char const *>, 4> ADDRESS_FIELDS =
    {{{&Assignment::sender, "sender"},
      {&Assignment::receiver, "receiver"},
      {&Assignment::spender, "spender"},
      {&Assignment::bystander, "bystander"}}};

// Canonical addresses rank by position, then null, then anything else
size_t address_rank(Address const &address)
{
    auto const it = std::ranges::find(CANONICAL_ADDRESSES, address);
    if (it != CANONICAL_ADDRESSES.end()) {
        return static_cast<size_t>(it - CANONICAL_ADDRESSES.begin());
    }
    return is_null(address) ? CANONICAL_ADDRESSES.size()
                            : CANONICAL_ADDRESSES.size() + 1;
}

// Strictly decreases with every accepted address move, so address
// shrinking terminates
size_t address_weight(Assignment const &a)
{
    std::set<Address> distinct;
    size_t weight = 0;
    for (auto const &[field, name] : ADDRESS_FIELDS) {
        distinct.insert(a.*field);
        weight += address_rank(a.*field);
    }
    return weight + 8 * distinct.size();
}

STDPROP_ANONYMOUS_NAMESPACE_END

STDPROP_NAMESPACE_BEGIN

Shrinker::Shrinker(
    Property const &property, SubjectFactory const &factory,
    size_t const max_steps, size_t const max_rounds)
    : property_{property}
    , factory_{factory}
    , max_steps_{max_steps}
    , max_rounds_{max_rounds}
{
}

bool Shrinker::reproduces(
    Assignment const &candidate, DefectKind const defect,
    EvaluationRecord &record) const
{
    if (!property_.precondition(candidate)) {
        return false;
    }
    auto const res =
        evaluate(property_, factory_, candidate, max_steps_, record);
    return res.has_error() &&
           res.assume_error() == EvaluationError::PropertyViolation &&
           record.defect == defect;
}

ShrinkResult
Shrinker::shrink(Assignment const &witness, EvaluationRecord record) const
{
    STDPROP_ASSERT(record.defect != DefectKind::None);

    ShrinkResult result{.assignment = witness, .record = std::move(record)};
    auto const defect = result.record.defect;

    auto const accept = [&](Assignment const &candidate,
                            char const *const field,
                            std::string const &value) {
        EvaluationRecord candidate_record;
        if (!reproduces(candidate, defect, candidate_record)) {
            return false;
        }
        result.assignment = candidate;
        result.record = std::move(candidate_record);
        ++result.steps;
        LOG_DEBUG(
            "{} shrink step {}: {} -> {}",
            property_.id,
            result.steps,
            field,
            value);
        return true;
    };

    auto const shrink_amount = [&](AmountField const field,
                                   char const *const name) {
        auto const value = result.assignment.*field;
        if (value == 0) {
            return false;
        }
        auto candidate = result.assignment;
        candidate.*field = 0;
        if (accept(candidate, name, "0")) {
            return true;
        }
        // smallest failing value in [lo, hi], hi failing
        bool progress = false;
        uint256_t lo = 1;
        uint256_t hi = value;
        while (lo < hi) {
            auto const mid = lo + (hi - lo) / 2;
            candidate = result.assignment;
            candidate.*field = mid;
            if (accept(candidate, name, fmt::to_string(mid))) {
                hi = mid;
                progress = true;
            }
            else {
                lo = mid + 1;
            }
        }
        return progress;
    };

    auto const shrink_address = [&](AddressField const field,
                                    char const *const name) {
        auto const current_weight = address_weight(result.assignment);
        auto const try_address = [&](Address const &address) {
            if (address == result.assignment.*field) {
                return false;
            }
            auto candidate = result.assignment;
            candidate.*field = address;
            if (address_weight(candidate) >= current_weight) {
                return false;
            }
            return accept(candidate, name, fmt::format("{}", address));
        };
        for (auto const &address : CANONICAL_ADDRESSES) {
            if (try_address(address)) {
                return true;
            }
        }
        for (auto const &[other, other_name] : ADDRESS_FIELDS) {
            if (other != field && try_address(result.assignment.*other)) {
                return true;
            }
        }
        return false;
    };

    while (result.rounds < max_rounds_) {
        ++result.rounds;
        bool progress = false;
        for (auto const &[field, name] : AMOUNT_FIELDS) {
            progress |= shrink_amount(field, name);
        }
        for (auto const &[field, name] : ADDRESS_FIELDS) {
            progress |= shrink_address(field, name);
        }
        if (!progress) {
            break;
        }
    }
    return result;
}

STDPROP_NAMESPACE_END
