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
#include <stdprop/core/bytes.hpp>
#include <stdprop/core/config.hpp>
#include <stdprop/core/int.hpp>

#include <intx/intx.hpp>

#include <cstdint>
#include <cstring>
#include <initializer_list>

STDPROP_NAMESPACE_BEGIN

inline bytes32_t abi_encode_address(Address const &address) noexcept
{
    bytes32_t word{};
    std::memcpy(
        word.bytes + sizeof(bytes32_t) - sizeof(Address),
        address.bytes,
        sizeof(Address));
    return word;
}

inline bytes32_t abi_encode_uint(uint256_t const &value) noexcept
{
    return intx::be::store<bytes32_t>(value);
}

inline bytes32_t abi_encode_bool(bool const value) noexcept
{
    bytes32_t word{};
    word.bytes[sizeof(bytes32_t) - 1] = value ? 1 : 0;
    return word;
}

inline byte_string
abi_encode_call(uint32_t const selector, std::initializer_list<bytes32_t> args)
{
    byte_string calldata;
    calldata.reserve(sizeof(uint32_t) + args.size() * sizeof(bytes32_t));
    calldata.push_back(static_cast<uint8_t>(selector >> 24));
    calldata.push_back(static_cast<uint8_t>(selector >> 16));
    calldata.push_back(static_cast<uint8_t>(selector >> 8));
    calldata.push_back(static_cast<uint8_t>(selector));
    for (auto const &arg : args) {
        calldata.append(arg.bytes, sizeof(bytes32_t));
    }
    return calldata;
}

inline byte_string to_byte_string(bytes32_t const &word)
{
    return byte_string{word.bytes, sizeof(bytes32_t)};
}

STDPROP_NAMESPACE_END
