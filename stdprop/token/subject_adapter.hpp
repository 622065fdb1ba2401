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
#include <stdprop/core/byte_string.hpp>
#include <stdprop/core/config.hpp>
#include <stdprop/core/int.hpp>
#include <stdprop/core/result.hpp>
#include <stdprop/token/call_outcome.hpp>
#include <stdprop/token/subject_error.hpp>
#include <stdprop/token/token_subject.hpp>

#include <evmc/evmc.hpp>

#include <cstddef>
#include <cstdint>
#include <limits>
#include <string>

using namespace evmc::literals;

STDPROP_NAMESPACE_BEGIN

inline constexpr Address TOKEN_ADDRESS =
    0x00000000000000000000000000000000000020a0_address;

// Gas is not metered; every message carries this much and gets it back
inline constexpr int64_t CALL_GAS = 30'000'000;

// Calls a TokenSubject through its ABI entry point in one of two modes.
//
// Typed calls decode the return data and fold a revert into
// SubjectError::Reverted, so a caller cannot tell a revert from an
// undecodable return. Raw calls keep the distinction: the outcome says
// whether the call reverted or completed, and with what data.
//
// Every call, setup or otherwise, consumes one step. Once the budget is
// spent every call fails with SubjectError::StepBudgetExceeded without
// reaching the subject.
class SubjectAdapter
{
    TokenSubject &subject_;
    size_t max_steps_;
    size_t steps_{0};
    std::string last_revert_reason_{};

    Result<void> charge();
    Result<CallOutcome> dispatch(
        Address const &caller, byte_string const &calldata, bool returns_bool);
    Result<bool> typed_bool(Result<CallOutcome>);
    Result<uint256_t> typed_word(Result<CallOutcome>);

public:
    explicit SubjectAdapter(
        TokenSubject &,
        size_t max_steps = std::numeric_limits<size_t>::max());

    TokenSubject &subject() noexcept
    {
        return subject_;
    }

    size_t steps() const noexcept
    {
        return steps_;
    }

    std::string const &last_revert_reason() const noexcept
    {
        return last_revert_reason_;
    }

    Result<void> mint(Address const &to, uint256_t const &amount);

    // typed
    Result<uint256_t> total_supply();
    Result<uint256_t> balance_of(Address const &account);
    Result<uint256_t> allowance(Address const &owner, Address const &spender);
    Result<bool>
    transfer(Address const &caller, Address const &to, uint256_t const &amount);
    Result<bool> transfer_from(
        Address const &caller, Address const &from, Address const &to,
        uint256_t const &amount);
    Result<bool> approve(
        Address const &caller, Address const &spender, uint256_t const &amount);

    // raw
    Result<CallOutcome> raw_total_supply();
    Result<CallOutcome> raw_balance_of(Address const &account);
    Result<CallOutcome>
    raw_allowance(Address const &owner, Address const &spender);
    Result<CallOutcome> raw_transfer(
        Address const &caller, Address const &to, uint256_t const &amount);
    Result<CallOutcome> raw_transfer_from(
        Address const &caller, Address const &from, Address const &to,
        uint256_t const &amount);
    Result<CallOutcome> raw_approve(
        Address const &caller, Address const &spender, uint256_t const &amount);
    Result<CallOutcome> raw_call(Address const &caller, byte_string const &);
};

STDPROP_NAMESPACE_END
