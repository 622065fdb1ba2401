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
#include <stdprop/property/assignment.hpp>

#include <cstdint>
#include <string_view>

STDPROP_NAMESPACE_BEGIN

class Evaluation;
class Generator;

enum class Operation : uint8_t
{
    TotalSupply,
    BalanceOf,
    Allowance,
    Transfer,
    TransferFrom,
    Approve,
};

enum class CallMode : uint8_t
{
    Typed,
    Raw,
};

std::string_view to_string(Operation);
std::string_view to_string(CallMode);

// transfer, transferFrom and approve
bool is_mutating(Operation);

// A property is a generator/precondition pair plus an evaluation. The
// generator narrows a random assignment towards the precondition, which is
// then checked on its own, so shrunk or replayed assignments go through the
// same filter. The evaluation issues the call under test and checks the
// postcondition; it may still require facts about the seeded state.
struct Property
{
    std::string_view id;
    std::string_view name;
    Operation operation;
    CallMode mode;
    std::string_view statement;
    void (*narrow)(Generator &, Assignment &);
    bool (*precondition)(Assignment const &);
    Result<void> (*evaluate)(Evaluation &);
};

STDPROP_NAMESPACE_END
