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

#include <stdprop/core/assert.h>
#include <stdprop/core/likely.h>
#include <stdprop/core/result.hpp>
#include <stdprop/explore/explorer.hpp>
#include <stdprop/explore/report.hpp>
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
#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <thread>
#include <utility>
#include <vector>

STDPROP_ANONYMOUS_NAMESPACE_BEGIN

// splitmix64 finalizer
constexpr uint64_t mix(uint64_t x)
{
    x += 0x9e3779b97f4a7c15;
    x = (x ^ (x >> 30)) * 0xbf58476d1ce4e5b9;
    x = (x ^ (x >> 27)) * 0x94d049bb133111eb;
    return x ^ (x >> 31);
}

STDPROP_ANONYMOUS_NAMESPACE_END

STDPROP_NAMESPACE_BEGIN

Generator::seed_t
property_seed(Generator::seed_t const run_seed, Property const &property)
{
    uint64_t h = run_seed;
    for (auto const c : property.id) {
        h = mix(h ^ static_cast<uint8_t>(c));
    }
    return h;
}

Explorer::Explorer(ExplorerConfig config, SubjectFactory factory)
    : config_{std::move(config)}
    , factory_{std::move(factory)}
{
    STDPROP_ASSERT(factory_);
}

PropertyReport Explorer::explore(Property const &property) const
{
    using clock = std::chrono::steady_clock;

    PropertyReport report{.id = property.id, .name = property.name};
    Generator gen{property_seed(config_.seed, property)};
    auto const begin = clock::now();
    auto const elapsed = [&] {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
            clock::now() - begin);
    };

    size_t const max_attempts = config_.iterations * (config_.max_retries + 1);
    bool timed_out = false;
    for (size_t attempt = 0;
         attempt < max_attempts && report.evaluations < config_.iterations;
         ++attempt) {
        if (STDPROP_UNLIKELY(elapsed() > config_.time_budget)) {
            timed_out = true;
            break;
        }

        auto input = gen.gen_assignment();
        if (property.narrow != nullptr) {
            property.narrow(gen, input);
        }
        if (!property.precondition(input)) {
            ++report.discards;
            continue;
        }

        EvaluationRecord record;
        auto const res = evaluate(
            property, factory_, input, config_.max_steps, record);
        if (res.has_value()) {
            ++report.evaluations;
            continue;
        }
        auto const &error = res.assume_error();
        if (error == EvaluationError::PreconditionUnsatisfied) {
            ++report.discards;
            continue;
        }
        if (error == EvaluationError::StepBudgetExceeded) {
            ++report.step_overruns;
            continue;
        }
        STDPROP_ASSERT(error == EvaluationError::PropertyViolation);
        ++report.evaluations;

        LOG_WARNING(
            "{} failed: {}; shrinking {}",
            property.id,
            record.message,
            fmt::format("{}", input));
        Shrinker const shrinker{
            property, factory_, config_.max_steps, config_.shrink_rounds};
        auto shrunk = shrinker.shrink(input, std::move(record));
        report.verdict = Verdict::Fail;
        report.defect = shrunk.record.defect;
        report.shrink_steps = shrunk.steps;
        report.counterexample = Counterexample{
            .assignment = shrunk.assignment,
            .record = std::move(shrunk.record)};
        report.elapsed = elapsed();
        LOG_WARNING(
            "{} witness after {} shrink steps: {}: {}",
            property.id,
            report.shrink_steps,
            report.counterexample->record.message,
            fmt::format("{}", report.counterexample->assignment));
        return report;
    }

    report.elapsed = elapsed();
    if (timed_out || report.step_overruns != 0) {
        report.verdict = Verdict::Inconclusive;
        report.reason = InconclusiveReason::Timeout;
    }
    else if (report.evaluations < config_.iterations) {
        // attempts ran out before enough inputs met the precondition
        report.verdict = Verdict::Inconclusive;
        report.reason = InconclusiveReason::PreconditionUnsatisfiable;
    }

    if (report.verdict == Verdict::Inconclusive) {
        LOG_WARNING("{}", summarize(report));
    }
    else {
        LOG_INFO("{}", summarize(report));
    }
    return report;
}

std::vector<PropertyReport>
Explorer::run(std::span<Property const> const properties) const
{
    LOG_INFO(
        "exploring {} properties with seed {}: iterations={} max_retries={} "
        "max_steps={} time_budget={}ms shrink_rounds={} threads={}",
        properties.size(),
        config_.seed,
        config_.iterations,
        config_.max_retries,
        config_.max_steps,
        config_.time_budget.count(),
        config_.shrink_rounds,
        config_.threads);

    std::vector<PropertyReport> reports(properties.size());
    std::atomic<size_t> next{0};
    auto const work = [&] {
        for (auto i = next.fetch_add(1, std::memory_order_relaxed);
             i < properties.size();
             i = next.fetch_add(1, std::memory_order_relaxed)) {
            reports[i] = explore(properties[i]);
        }
    };

    size_t const nworkers = std::clamp<size_t>(
        config_.threads, 1, std::max<size_t>(properties.size(), 1));
    {
        std::vector<std::jthread> workers;
        workers.reserve(nworkers);
        for (size_t i = 0; i < nworkers; ++i) {
            workers.emplace_back(work);
        }
    }
    return reports;
}

Result<void> Explorer::replay(
    Property const &property, Assignment const &input,
    EvaluationRecord &record) const
{
    return evaluate(property, factory_, input, config_.max_steps, record);
}

STDPROP_NAMESPACE_END
