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
#include <stdprop/core/byte_string.hpp>
#include <stdprop/core/int.hpp>
#include <stdprop/core/likely.h>
#include <stdprop/core/result.hpp>
#include <stdprop/token/abi/abi_decode.hpp>
#include <stdprop/token/abi/abi_encode.hpp>
#include <stdprop/token/abi/abi_signatures.hpp>
#include <stdprop/token/call_outcome.hpp>
#include <stdprop/token/subject_adapter.hpp>
#include <stdprop/token/subject_error.hpp>

#include <boost/outcome/success_failure.hpp>
#include <boost/outcome/try.hpp>

#include <evmc/evmc.h>
#include <evmc/evmc.hpp>

#include <optional>
#include <utility>

STDPROP_ANONYMOUS_NAMESPACE_BEGIN

std::optional<bool> decode_bool_return(byte_string const &output)
{
    byte_string_view input{output};
    auto const value = abi_decode_bool(input);
    if (value.has_error() || !input.empty()) {
        return std::nullopt;
    }
    return value.assume_value();
}

STDPROP_ANONYMOUS_NAMESPACE_END

STDPROP_NAMESPACE_BEGIN

SubjectAdapter::SubjectAdapter(TokenSubject &subject, size_t const max_steps)
    : subject_{subject}
    , max_steps_{max_steps}
{
}

Result<void> SubjectAdapter::charge()
{
    if (STDPROP_UNLIKELY(steps_ >= max_steps_)) {
        return SubjectError::StepBudgetExceeded;
    }
    ++steps_;
    return outcome::success();
}

Result<CallOutcome> SubjectAdapter::dispatch(
    Address const &caller, byte_string const &calldata,
    bool const returns_bool)
{
    BOOST_OUTCOME_TRY(charge());

    evmc_message msg{};
    msg.kind = EVMC_CALL;
    msg.gas = CALL_GAS;
    msg.sender = caller;
    msg.recipient = TOKEN_ADDRESS;
    msg.code_address = TOKEN_ADDRESS;
    msg.input_data = calldata.data();
    msg.input_size = calldata.size();

    auto const result = subject_.call(msg);

    CallOutcome observed;
    if (result.output_size != 0) {
        observed.output = byte_string{result.output_data, result.output_size};
    }
    if (result.status_code != EVMC_SUCCESS) {
        observed.status = CallOutcome::Status::Reverted;
        last_revert_reason_ = observed.revert_reason();
        return observed;
    }
    observed.status = CallOutcome::Status::Completed;
    if (returns_bool) {
        observed.return_value = decode_bool_return(observed.output);
    }
    return observed;
}

Result<bool> SubjectAdapter::typed_bool(Result<CallOutcome> res)
{
    auto const observed = BOOST_OUTCOME_TRYX(std::move(res));
    if (observed.is_reverted()) {
        return SubjectError::Reverted;
    }
    if (STDPROP_UNLIKELY(!observed.return_value.has_value())) {
        return SubjectError::MalformedReturn;
    }
    return *observed.return_value;
}

Result<uint256_t> SubjectAdapter::typed_word(Result<CallOutcome> res)
{
    auto const observed = BOOST_OUTCOME_TRYX(std::move(res));
    if (observed.is_reverted()) {
        return SubjectError::Reverted;
    }
    auto const value = observed.word();
    if (STDPROP_UNLIKELY(!value.has_value())) {
        return SubjectError::MalformedReturn;
    }
    return *value;
}

Result<void> SubjectAdapter::mint(Address const &to, uint256_t const &amount)
{
    BOOST_OUTCOME_TRY(charge());
    return subject_.mint(to, amount);
}

Result<uint256_t> SubjectAdapter::total_supply()
{
    return typed_word(raw_total_supply());
}

Result<uint256_t> SubjectAdapter::balance_of(Address const &account)
{
    return typed_word(raw_balance_of(account));
}

Result<uint256_t>
SubjectAdapter::allowance(Address const &owner, Address const &spender)
{
    return typed_word(raw_allowance(owner, spender));
}

Result<bool> SubjectAdapter::transfer(
    Address const &caller, Address const &to, uint256_t const &amount)
{
    return typed_bool(raw_transfer(caller, to, amount));
}

Result<bool> SubjectAdapter::transfer_from(
    Address const &caller, Address const &from, Address const &to,
    uint256_t const &amount)
{
    return typed_bool(raw_transfer_from(caller, from, to, amount));
}

Result<bool> SubjectAdapter::approve(
    Address const &caller, Address const &spender, uint256_t const &amount)
{
    return typed_bool(raw_approve(caller, spender, amount));
}

Result<CallOutcome> SubjectAdapter::raw_total_supply()
{
    return dispatch(
        NULL_ADDRESS, abi_encode_call(TOTAL_SUPPLY_SELECTOR, {}), false);
}

Result<CallOutcome> SubjectAdapter::raw_balance_of(Address const &account)
{
    return dispatch(
        NULL_ADDRESS,
        abi_encode_call(BALANCE_OF_SELECTOR, {abi_encode_address(account)}),
        false);
}

Result<CallOutcome>
SubjectAdapter::raw_allowance(Address const &owner, Address const &spender)
{
    return dispatch(
        NULL_ADDRESS,
        abi_encode_call(
            ALLOWANCE_SELECTOR,
            {abi_encode_address(owner), abi_encode_address(spender)}),
        false);
}

Result<CallOutcome> SubjectAdapter::raw_transfer(
    Address const &caller, Address const &to, uint256_t const &amount)
{
    return dispatch(
        caller,
        abi_encode_call(
            TRANSFER_SELECTOR,
            {abi_encode_address(to), abi_encode_uint(amount)}),
        true);
}

Result<CallOutcome> SubjectAdapter::raw_transfer_from(
    Address const &caller, Address const &from, Address const &to,
    uint256_t const &amount)
{
    return dispatch(
        caller,
        abi_encode_call(
            TRANSFER_FROM_SELECTOR,
            {abi_encode_address(from),
             abi_encode_address(to),
             abi_encode_uint(amount)}),
        true);
}

Result<CallOutcome> SubjectAdapter::raw_approve(
    Address const &caller, Address const &spender, uint256_t const &amount)
{
    return dispatch(
        caller,
        abi_encode_call(
            APPROVE_SELECTOR,
            {abi_encode_address(spender), abi_encode_uint(amount)}),
        true);
}

Result<CallOutcome>
SubjectAdapter::raw_call(Address const &caller, byte_string const &calldata)
{
    return dispatch(caller, calldata, true);
}

STDPROP_NAMESPACE_END
