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

#include <stdprop/core/address.hpp>
#include <stdprop/core/config.hpp>
#include <stdprop/core/int.hpp>
#include <stdprop/core/result.hpp>
#include <stdprop/token/account_state.hpp>

#include <evmc/evmc.h>
#include <evmc/evmc.hpp>

#include <functional>
#include <memory>

STDPROP_NAMESPACE_BEGIN

// A token under test. Every call applies all of its effects or none of them.
class TokenSubject
{
public:
    virtual ~TokenSubject() = default;

    // Harness privilege used to seed balances
    virtual Result<void> mint(Address const &to, uint256_t const &amount) = 0;

    // ABI entry point. Completion is EVMC_SUCCESS with the encoded return
    // data, anything else is a revert.
    virtual evmc::Result call(evmc_message const &) = 0;

    virtual AccountState const &state() const = 0;
};

using SubjectFactory = std::function<std::unique_ptr<TokenSubject>()>;

STDPROP_NAMESPACE_END
