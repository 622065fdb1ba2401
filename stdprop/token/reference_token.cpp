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
#include <stdprop/core/arith/checked.hpp>
#include <stdprop/core/byte_string.hpp>
#include <stdprop/core/int.hpp>
#include <stdprop/core/likely.h>
#include <stdprop/core/result.hpp>
#include <stdprop/token/abi/abi_decode.hpp>
#include <stdprop/token/abi/abi_encode.hpp>
#include <stdprop/token/abi/abi_signatures.hpp>
#include <stdprop/token/reference_token.hpp>
#include <stdprop/token/staged_state.hpp>
#include <stdprop/token/token_error.hpp>
#include <stdprop/token/token_flaw.hpp>

#include <boost/outcome/success_failure.hpp>
#include <boost/outcome/try.hpp>

#include <evmc/evmc.h>
#include <evmc/evmc.hpp>

#include <cstdint>
#include <memory>
#include <optional>
#include <utility>

STDPROP_ANONYMOUS_NAMESPACE_BEGIN

evmc::Result make_result(
    evmc_status_code const status, int64_t const gas_left,
    uint8_t const *const data, size_t const size)
{
    return evmc::Result(status, gas_left, 0 /* gas refund */, data, size);
}

STDPROP_ANONYMOUS_NAMESPACE_END

STDPROP_NAMESPACE_BEGIN

ReferenceToken::ReferenceToken(Config config)
    : config_{std::move(config)}
{
}

byte_string ReferenceToken::completed() const
{
    if (has(TokenFlaw::MissingReturnValue)) {
        return {};
    }
    return to_byte_string(abi_encode_bool(true));
}

Result<void> ReferenceToken::mint(Address const &to, uint256_t const &amount)
{
    if (STDPROP_UNLIKELY(is_null(to))) {
        return TokenError::ZeroAddress;
    }

    StagedState staged{state_};
    auto const credited = checked_add(staged.balance_of(to), amount);
    if (STDPROP_UNLIKELY(!credited.has_value())) {
        return TokenError::BalanceOverflow;
    }
    staged.set_balance(to, *credited);
    if (!has(TokenFlaw::MintSkipsSupply)) {
        // supply may wrap so that near-MAX balances can be seeded
        staged.set_total_supply(add(staged.total_supply(), amount).first);
    }
    return state_.commit(staged.delta());
}

Result<void> ReferenceToken::move_balance(
    StagedState &staged, Address const &from, Address const &to,
    uint256_t const &amount)
{
    if (STDPROP_UNLIKELY(is_null(from))) {
        return TokenError::ZeroAddress;
    }
    bool const burn = is_null(to) && has(TokenFlaw::ZeroAddressBurns);
    if (STDPROP_UNLIKELY(is_null(to) && !burn)) {
        return TokenError::ZeroAddress;
    }
    if (STDPROP_UNLIKELY(amount == 0 && has(TokenFlaw::ZeroAmountReverts))) {
        return TokenError::InvalidInput;
    }

    auto const from_balance = staged.balance_of(from);
    auto const debited = checked_sub(from_balance, amount);
    if (STDPROP_UNLIKELY(!debited.has_value())) {
        return TokenError::InsufficientBalance;
    }

    if (burn) {
        staged.set_balance(from, *debited);
        staged.set_total_supply(sub(staged.total_supply(), amount).first);
        return outcome::success();
    }

    if (from == to && !has(TokenFlaw::SelfTransferCredits)) {
        return outcome::success();
    }

    uint256_t const fee = has(TokenFlaw::TransferFee) ? amount / 100 : 0;
    uint256_t const received = amount - fee;
    auto const to_balance = from == to ? from_balance : staged.balance_of(to);
    auto const credited = has(TokenFlaw::WrappingCredit)
                              ? std::optional{add(to_balance, received).first}
                              : checked_add(to_balance, received);
    if (STDPROP_UNLIKELY(!credited.has_value())) {
        return TokenError::BalanceOverflow;
    }

    staged.set_balance(from, *debited);
    staged.set_balance(to, *credited);
    if (fee != 0) {
        staged.set_total_supply(sub(staged.total_supply(), fee).first);
    }
    return outcome::success();
}

evmc::Result ReferenceToken::call(evmc_message const &msg)
{
    byte_string_view input{msg.input_data, msg.input_size};
    auto const method = dispatch(input);
    auto const output = (this->*method)(input, Address{msg.sender});
    if (STDPROP_LIKELY(output.has_value())) {
        auto const &data = output.assume_value();
        return make_result(EVMC_SUCCESS, msg.gas, data.data(), data.size());
    }

    auto const &error = output.assume_error();
    if (has(TokenFlaw::ReturnFalseOnFailure) &&
        (error == TokenError::InsufficientBalance ||
         error == TokenError::InsufficientAllowance)) {
        auto const word = abi_encode_bool(false);
        return make_result(EVMC_SUCCESS, msg.gas, word.bytes, sizeof(word));
    }

    auto const message = error.message();
    return make_result(
        EVMC_REVERT,
        msg.gas,
        reinterpret_cast<uint8_t const *>(message.c_str()),
        message.size());
}

ReferenceToken::DispatchFunc ReferenceToken::dispatch(byte_string_view &input)
{
    auto const selector = abi_decode_selector(input);
    if (STDPROP_UNLIKELY(selector.has_error())) {
        return &ReferenceToken::call_fallback;
    }

    switch (selector.assume_value()) {
    case TOTAL_SUPPLY_SELECTOR:
        return &ReferenceToken::call_total_supply;
    case BALANCE_OF_SELECTOR:
        return &ReferenceToken::call_balance_of;
    case ALLOWANCE_SELECTOR:
        return &ReferenceToken::call_allowance;
    case TRANSFER_SELECTOR:
        return &ReferenceToken::call_transfer;
    case TRANSFER_FROM_SELECTOR:
        return &ReferenceToken::call_transfer_from;
    case APPROVE_SELECTOR:
        return &ReferenceToken::call_approve;
    default:
        return &ReferenceToken::call_fallback;
    }
}

Result<byte_string>
ReferenceToken::call_total_supply(byte_string_view, Address const &)
{
    auto supply = state_.total_supply();
    if (has(TokenFlaw::TotalSupplyOffByOne)) {
        supply = add(supply, uint256_t{1}).first;
    }
    return to_byte_string(abi_encode_uint(supply));
}

Result<byte_string>
ReferenceToken::call_balance_of(byte_string_view input, Address const &)
{
    auto const account = BOOST_OUTCOME_TRYX(abi_decode_address(input));
    if (STDPROP_UNLIKELY(
            is_null(account) && has(TokenFlaw::BalanceOfNullReverts))) {
        return TokenError::ZeroAddress;
    }
    return to_byte_string(abi_encode_uint(state_.balance_of(account)));
}

Result<byte_string>
ReferenceToken::call_allowance(byte_string_view input, Address const &)
{
    auto const owner = BOOST_OUTCOME_TRYX(abi_decode_address(input));
    auto const spender = BOOST_OUTCOME_TRYX(abi_decode_address(input));
    return to_byte_string(abi_encode_uint(state_.allowance_of(owner, spender)));
}

Result<byte_string>
ReferenceToken::call_transfer(byte_string_view input, Address const &sender)
{
    auto const to = BOOST_OUTCOME_TRYX(abi_decode_address(input));
    auto const amount = BOOST_OUTCOME_TRYX(abi_decode_uint(input));

    StagedState staged{state_};
    BOOST_OUTCOME_TRY(move_balance(staged, sender, to, amount));
    if (has(TokenFlaw::TransferResetsAllowance)) {
        staged.set_allowance(sender, to, 0);
    }
    BOOST_OUTCOME_TRY(state_.commit(staged.delta()));
    return completed();
}

Result<byte_string> ReferenceToken::call_transfer_from(
    byte_string_view input, Address const &spender)
{
    auto const from = BOOST_OUTCOME_TRYX(abi_decode_address(input));
    auto const to = BOOST_OUTCOME_TRYX(abi_decode_address(input));
    auto const amount = BOOST_OUTCOME_TRYX(abi_decode_uint(input));

    StagedState staged{state_};
    auto const allowance = staged.allowance_of(from, spender);
    bool const unlimited =
        config_.unlimited_allowance && allowance == MAX_UINT256;
    if (STDPROP_UNLIKELY(
            allowance < amount && !unlimited &&
            !has(TokenFlaw::AllowanceUnchecked))) {
        return TokenError::InsufficientAllowance;
    }
    BOOST_OUTCOME_TRY(move_balance(staged, from, to, amount));
    if (has(TokenFlaw::SelfTransferFromPaysSpender) && from == to) {
        auto const paid = checked_add(staged.balance_of(spender), amount);
        if (STDPROP_UNLIKELY(!paid.has_value())) {
            return TokenError::BalanceOverflow;
        }
        staged.set_balance(spender, *paid);
    }
    if (!unlimited && !has(TokenFlaw::AllowanceNotConsumed)) {
        staged.set_allowance(from, spender, saturating_sub(allowance, amount));
    }
    BOOST_OUTCOME_TRY(state_.commit(staged.delta()));
    return completed();
}

Result<byte_string>
ReferenceToken::call_approve(byte_string_view input, Address const &owner)
{
    auto const spender = BOOST_OUTCOME_TRYX(abi_decode_address(input));
    auto const amount = BOOST_OUTCOME_TRYX(abi_decode_uint(input));
    if (STDPROP_UNLIKELY(is_null(spender))) {
        return TokenError::ZeroAddress;
    }

    StagedState staged{state_};
    auto const current = staged.allowance_of(owner, spender);
    auto const allowance = has(TokenFlaw::ApproveAccumulates)
                               ? saturating_add(current, amount)
                               : amount;
    staged.set_allowance(owner, spender, allowance);
    if (has(TokenFlaw::ApproveMirrorsAllowance)) {
        staged.set_allowance(spender, owner, allowance);
    }
    BOOST_OUTCOME_TRY(state_.commit(staged.delta()));
    return completed();
}

Result<byte_string>
ReferenceToken::call_fallback(byte_string_view, Address const &)
{
    return TokenError::MethodNotSupported;
}

SubjectFactory make_reference_token_factory(ReferenceToken::Config config)
{
    return [config = std::move(config)]() -> std::unique_ptr<TokenSubject> {
        return std::make_unique<ReferenceToken>(config);
    };
}

STDPROP_NAMESPACE_END
