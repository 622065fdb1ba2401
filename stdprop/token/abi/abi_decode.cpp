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
#include <stdprop/core/bytes.hpp>
#include <stdprop/core/int.hpp>
#include <stdprop/core/likely.h>
#include <stdprop/core/result.hpp>
#include <stdprop/token/abi/abi_decode.hpp>
#include <stdprop/token/abi/abi_decode_error.hpp>

#include <intx/intx.hpp>

#include <algorithm>
#include <cstdint>
#include <cstring>

STDPROP_ANONYMOUS_NAMESPACE_BEGIN

constexpr size_t ADDRESS_PADDING = sizeof(bytes32_t) - sizeof(Address);

STDPROP_ANONYMOUS_NAMESPACE_END

STDPROP_NAMESPACE_BEGIN

Result<uint32_t> abi_decode_selector(byte_string_view &input)
{
    if (STDPROP_UNLIKELY(input.size() < sizeof(uint32_t))) {
        return AbiDecodeError::InputTooShort;
    }
    auto const selector = intx::be::unsafe::load<uint32_t>(input.data());
    input.remove_prefix(sizeof(uint32_t));
    return selector;
}

Result<Address> abi_decode_address(byte_string_view &input)
{
    if (STDPROP_UNLIKELY(input.size() < sizeof(bytes32_t))) {
        return AbiDecodeError::InputTooShort;
    }
    auto const padding = input.substr(0, ADDRESS_PADDING);
    if (STDPROP_UNLIKELY(std::ranges::any_of(
            padding, [](uint8_t const b) { return b != 0; }))) {
        return AbiDecodeError::DirtyAddress;
    }
    Address address{};
    std::memcpy(address.bytes, input.data() + ADDRESS_PADDING, sizeof(Address));
    input.remove_prefix(sizeof(bytes32_t));
    return address;
}

Result<uint256_t> abi_decode_uint(byte_string_view &input)
{
    if (STDPROP_UNLIKELY(input.size() < sizeof(bytes32_t))) {
        return AbiDecodeError::InputTooShort;
    }
    auto const value = intx::be::unsafe::load<uint256_t>(input.data());
    input.remove_prefix(sizeof(bytes32_t));
    return value;
}

Result<bool> abi_decode_bool(byte_string_view &input)
{
    if (STDPROP_UNLIKELY(input.size() < sizeof(bytes32_t))) {
        return AbiDecodeError::InputTooShort;
    }
    auto const value = intx::be::unsafe::load<uint256_t>(input.data());
    if (STDPROP_UNLIKELY(value > 1)) {
        return AbiDecodeError::InvalidBool;
    }
    input.remove_prefix(sizeof(bytes32_t));
    return value == 1;
}

STDPROP_NAMESPACE_END
