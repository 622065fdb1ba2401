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

#include <stdprop/core/assert.h>
#include <stdprop/core/config.hpp>

#include <optional>
#include <random>
#include <utility>

STDPROP_NAMESPACE_BEGIN

template <typename Action>
struct Choice
{
    double probability;
    Action action;

    Choice(double const p, Action a)
        : probability{p}
        , action{std::move(a)}
    {
    }
};

template <typename Engine>
bool toss(Engine &engine, double const probability)
{
    return std::bernoulli_distribution(probability)(engine);
}

// Picks at most one of the choices according to their probabilities and runs
// its action; the default action takes the remaining probability mass.
template <typename R, typename Engine, typename Default, typename... Actions>
R discrete_choice(
    Engine &engine, Default &&default_action, Choice<Actions>... choices)
{
    STDPROP_ASSERT(((choices.probability >= 0) && ...));
    STDPROP_ASSERT((0.0 + ... + choices.probability) <= 1.0);

    auto const roll = std::uniform_real_distribution<double>(0.0, 1.0)(engine);
    double cumulative = 0.0;
    std::optional<R> result;
    auto const try_choice = [&](auto &choice) {
        if (result.has_value()) {
            return;
        }
        cumulative += choice.probability;
        if (roll < cumulative) {
            result.emplace(choice.action(engine));
        }
    };
    (try_choice(choices), ...);

    if (!result.has_value()) {
        return std::forward<Default>(default_action)(engine);
    }
    return std::move(*result);
}

STDPROP_NAMESPACE_END
