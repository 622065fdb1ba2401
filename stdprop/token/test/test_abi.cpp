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
#include <stdprop/token/abi/abi_decode.hpp>
#include <stdprop/token/abi/abi_decode_error.hpp>
#include <stdprop/token/abi/abi_encode.hpp>
#include <stdprop/token/abi/abi_signatures.hpp>

#include <evmc/evmc.hpp>

#include <intx/intx.hpp>

#include <gtest/gtest.h>

#include <cstdint>

using namespace stdprop;
using namespace evmc::literals;
using namespace intx::literals;

TEST(AbiSelector, known_signatures)
{
    EXPECT_EQ(abi_encode_selector("totalSupply()"), 0x18160dddu);
    EXPECT_EQ(abi_encode_selector("balanceOf(address)"), 0x70a08231u);
    EXPECT_EQ(abi_encode_selector("allowance(address,address)"), 0xdd62ed3eu);
    EXPECT_EQ(abi_encode_selector("transfer(address,uint256)"), 0xa9059cbbu);
    EXPECT_EQ(
        abi_encode_selector("transferFrom(address,address,uint256)"),
        0x23b872ddu);
    EXPECT_EQ(abi_encode_selector("approve(address,uint256)"), 0x095ea7b3u);
    // not an ERC-20 method
    EXPECT_EQ(abi_encode_selector("name()"), 0x06fdde03u);
}

TEST(AbiEncode, call_layout)
{
    auto const to = 0x00000000000000000000000000000000000b0b00_address;
    auto const calldata = abi_encode_call(
        TRANSFER_SELECTOR,
        {abi_encode_address(to), abi_encode_uint(0x2a_u256)});
    ASSERT_EQ(calldata.size(), 4u + 2 * 32);
    EXPECT_EQ(calldata[0], 0xa9);
    EXPECT_EQ(calldata[3], 0xbb);
    EXPECT_EQ(calldata[4 + 12], 0x00);
    EXPECT_EQ(calldata[4 + 30], 0x0b);
    EXPECT_EQ(calldata[4 + 31], 0x00);
    EXPECT_EQ(calldata.back(), 0x2a);
}

TEST(AbiDecode, transfer_arguments)
{
    auto const to = 0xca201000000000000000000000000000000000ca_address;
    auto const calldata = abi_encode_call(
        TRANSFER_SELECTOR,
        {abi_encode_address(to), abi_encode_uint(MAX_UINT256)});

    byte_string_view input{calldata};
    auto const selector = abi_decode_selector(input);
    ASSERT_TRUE(selector.has_value());
    EXPECT_EQ(selector.value(), TRANSFER_SELECTOR);
    auto const address = abi_decode_address(input);
    ASSERT_TRUE(address.has_value());
    EXPECT_EQ(address.value(), to);
    auto const amount = abi_decode_uint(input);
    ASSERT_TRUE(amount.has_value());
    EXPECT_EQ(amount.value(), MAX_UINT256);
    EXPECT_TRUE(input.empty());
}

TEST(AbiDecode, short_input)
{
    byte_string const data(31, 0);
    byte_string_view input{data};
    auto const res = abi_decode_uint(input);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.error(), AbiDecodeError::InputTooShort);
    // nothing consumed on error
    EXPECT_EQ(input.size(), 31u);

    byte_string const selector{0x18, 0x16, 0x0d};
    byte_string_view selector_input{selector};
    EXPECT_TRUE(abi_decode_selector(selector_input).has_error());
}

TEST(AbiDecode, dirty_address)
{
    auto word =
        abi_encode_address(0x00000000000000000000000000000000000a11ce_address);
    word.bytes[0] = 0x01;
    auto const data = to_byte_string(word);
    byte_string_view input{data};
    auto const res = abi_decode_address(input);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.error(), AbiDecodeError::DirtyAddress);
}

TEST(AbiDecode, bool_values)
{
    {
        auto const data = to_byte_string(abi_encode_bool(true));
        byte_string_view input{data};
        auto const res = abi_decode_bool(input);
        ASSERT_TRUE(res.has_value());
        EXPECT_TRUE(res.value());
    }
    {
        auto const data = to_byte_string(abi_encode_bool(false));
        byte_string_view input{data};
        auto const res = abi_decode_bool(input);
        ASSERT_TRUE(res.has_value());
        EXPECT_FALSE(res.value());
    }
    {
        auto const data = to_byte_string(abi_encode_uint(2_u256));
        byte_string_view input{data};
        auto const res = abi_decode_bool(input);
        ASSERT_TRUE(res.has_error());
        EXPECT_EQ(res.error(), AbiDecodeError::InvalidBool);
    }
}
