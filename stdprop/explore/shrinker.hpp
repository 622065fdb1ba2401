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
#include <stdprop/property/assignment.hpp>
#include <stdprop/property/evaluation.hpp>
#include <stdprop/property/property.hpp>
#include <stdprop/token/token_subject.hpp>

#include <cstddef>

STDPROP_NAMESPACE_BEGIN

struct ShrinkResult
{
    Assignment assignment;
    EvaluationRecord record;
    size_t steps{0};
    size_t rounds{0};
};

// Minimizes a failing assignment. Amounts move towards zero, first straight
// to zero and then by bisection; addresses move towards the front of the
// canonical pool, or onto the address of another role. A candidate is kept
// only if it passes the precondition and still fails with the same defect
// kind. Each round visits every field once; shrinking stops after a round
// without progress or after max_rounds rounds. Deterministic.
class Shrinker
{
    Property const &property_;
    SubjectFactory const &factory_;
    size_t max_steps_;
    size_t max_rounds_;

    bool reproduces(Assignment const &, DefectKind, EvaluationRecord &) const;

public:
    Shrinker(
        Property const &, SubjectFactory const &, size_t max_steps,
        size_t max_rounds);

    ShrinkResult shrink(Assignment const &, EvaluationRecord) const;
};

STDPROP_NAMESPACE_END
