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
#include <stdprop/token/abi/abi_decode_error.hpp>

#include <cstdint>

STDPROP_NAMESPACE_BEGIN

// Each decoder consumes exactly one 32 byte word (4 bytes for the selector)
// from the front of the input on success and leaves it untouched on error.

Result<uint32_t> abi_decode_selector(byte_string_view &);
Result<Address> abi_decode_address(byte_string_view &);
Result<uint256_t> abi_decode_uint(byte_string_view &);
Result<bool> abi_decode_bool(byte_string_view &);

STDPROP_NAMESPACE_END
