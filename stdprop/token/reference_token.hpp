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
#include <stdprop/token/account_state.hpp>
#include <stdprop/token/staged_state.hpp>
#include <stdprop/token/token_flaw.hpp>
#include <stdprop/token/token_subject.hpp>

#include <evmc/evmc.h>
#include <evmc/evmc.hpp>

STDPROP_NAMESPACE_BEGIN

// clang-format off
// Morally, this subject is equivalent to the following Solidity contract,
// plus a privileged mint:
//
// contract Token {
//   mapping(address => uint256) balanceOf;
//   mapping(address => mapping(address => uint256)) allowance;
//   uint256 totalSupply;
//
//   function transfer(address to, uint256 amount) external returns (bool);
//   function transferFrom(address from, address to, uint256 amount)
//       external returns (bool);
//   function approve(address spender, uint256 amount) external returns (bool);
// }
//
// with checked arithmetic, zero address checks on both ends of a transfer
// and on the approved spender, and no events.
// clang-format on
class ReferenceToken final : public TokenSubject
{
public:
    struct Config
    {
        FlawSet flaws{};
        // An allowance of MAX is never decremented
        bool unlimited_allowance{false};
    };

private:
    Config config_;
    AccountState state_{};

    bool has(TokenFlaw const flaw) const
    {
        return config_.flaws.contains(flaw);
    }

    Result<void> move_balance(
        StagedState &, Address const &from, Address const &to,
        uint256_t const &amount);

    byte_string completed() const;

public:
    explicit ReferenceToken(Config config = {});

    Result<void> mint(Address const &, uint256_t const &) override;
    evmc::Result call(evmc_message const &) override;

    AccountState const &state() const override
    {
        return state_;
    }

    Config const &config() const noexcept
    {
        return config_;
    }

    using DispatchFunc =
        Result<byte_string> (ReferenceToken::*)(
            byte_string_view, Address const &);

    // Consumes the selector from the input
    static DispatchFunc dispatch(byte_string_view &);

    Result<byte_string> call_total_supply(byte_string_view, Address const &);
    Result<byte_string> call_balance_of(byte_string_view, Address const &);
    Result<byte_string> call_allowance(byte_string_view, Address const &);
    Result<byte_string> call_transfer(byte_string_view, Address const &);
    Result<byte_string> call_transfer_from(byte_string_view, Address const &);
    Result<byte_string> call_approve(byte_string_view, Address const &);
    Result<byte_string> call_fallback(byte_string_view, Address const &);
};

SubjectFactory make_reference_token_factory(ReferenceToken::Config);

STDPROP_NAMESPACE_END
