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
#include <stdprop/core/result.hpp>
#include <stdprop/explore/report.hpp>
#include <stdprop/property/assignment.hpp>
#include <stdprop/property/evaluation.hpp>
#include <stdprop/property/generator.hpp>
#include <stdprop/property/property.hpp>
#include <stdprop/token/token_subject.hpp>

#include <chrono>
#include <cstddef>
#include <span>
#include <vector>

STDPROP_NAMESPACE_BEGIN

struct ExplorerConfig
{
    Generator::seed_t seed{0};
    // satisfied evaluations per property
    size_t iterations{256};
    // resamples per iteration before giving up on it
    size_t max_retries{64};
    // adapter calls per evaluation, setup included
    size_t max_steps{16};
    std::chrono::milliseconds time_budget{10'000};
    size_t shrink_rounds{64};
    unsigned threads{1};
};

// Seed of one property's generator. Depends on the property, not on the
// order properties are run in.
Generator::seed_t property_seed(Generator::seed_t run_seed, Property const &);

class Explorer
{
    ExplorerConfig config_;
    SubjectFactory factory_;

public:
    Explorer(ExplorerConfig, SubjectFactory);

    ExplorerConfig const &config() const noexcept
    {
        return config_;
    }

    PropertyReport explore(Property const &) const;

    // Explores the properties on config().threads workers; reports are in
    // the order of the input
    std::vector<PropertyReport> run(std::span<Property const>) const;

    // Evaluates a single assignment, e.g. a reported witness
    Result<void>
    replay(Property const &, Assignment const &, EvaluationRecord &) const;
};

STDPROP_NAMESPACE_END
