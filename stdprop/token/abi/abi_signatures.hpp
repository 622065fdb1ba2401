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

#include <array>
#include <cstddef>
#include <cstdint>
#include <string_view>

STDPROP_NAMESPACE_BEGIN

namespace detail
{
    inline constexpr std::array<uint64_t, 24> KECCAK_ROUND_CONSTANTS = {
        0x0000000000000001ULL, 0x0000000000008082ULL, 0x800000000000808aULL,
        0x8000000080008000ULL, 0x000000000000808bULL, 0x0000000080000001ULL,
        0x8000000080008081ULL, 0x8000000000008009ULL, 0x000000000000008aULL,
        0x0000000000000088ULL, 0x0000000080008009ULL, 0x000000008000000aULL,
        0x000000008000808bULL, 0x800000000000008bULL, 0x8000000000008089ULL,
        0x8000000000008003ULL, 0x8000000000008002ULL, 0x8000000000000080ULL,
        0x000000000000800aULL, 0x800000008000000aULL, 0x8000000080008081ULL,
        0x8000000000008080ULL, 0x0000000080000001ULL, 0x8000000080008008ULL};

    inline constexpr std::array<unsigned, 24> KECCAK_ROTATIONS = {
        1,  3,  6,  10, 15, 21, 28, 36, 45, 55, 2,  14,
        27, 41, 56, 8,  25, 43, 62, 18, 39, 61, 20, 44};

    inline constexpr std::array<unsigned, 24> KECCAK_PI_LANES = {
        10, 7,  11, 17, 18, 3, 5,  16, 8,  21, 24, 4,
        15, 23, 19, 13, 12, 2, 20, 14, 22, 9,  6,  1};

    // keccak256 rate in bytes
    inline constexpr size_t KECCAK_RATE = 136;

    constexpr uint64_t rotl64(uint64_t const x, unsigned const n) noexcept
    {
        return (x << n) | (x >> (64 - n));
    }

    constexpr void keccak_f1600(std::array<uint64_t, 25> &st) noexcept
    {
        for (size_t round = 0; round < 24; ++round) {
            // theta
            std::array<uint64_t, 5> bc{};
            for (size_t i = 0; i < 5; ++i) {
                bc[i] = st[i] ^ st[i + 5] ^ st[i + 10] ^ st[i + 15] ^
                        st[i + 20];
            }
            for (size_t i = 0; i < 5; ++i) {
                uint64_t const t = bc[(i + 4) % 5] ^ rotl64(bc[(i + 1) % 5], 1);
                for (size_t j = 0; j < 25; j += 5) {
                    st[j + i] ^= t;
                }
            }

            // rho and pi
            uint64_t t = st[1];
            for (size_t i = 0; i < 24; ++i) {
                size_t const j = KECCAK_PI_LANES[i];
                uint64_t const next = st[j];
                st[j] = rotl64(t, KECCAK_ROTATIONS[i]);
                t = next;
            }

            // chi
            for (size_t j = 0; j < 25; j += 5) {
                for (size_t i = 0; i < 5; ++i) {
                    bc[i] = st[j + i];
                }
                for (size_t i = 0; i < 5; ++i) {
                    st[j + i] ^= (~bc[(i + 1) % 5]) & bc[(i + 2) % 5];
                }
            }

            // iota
            st[0] ^= KECCAK_ROUND_CONSTANTS[round];
        }
    }

    constexpr void
    keccak_absorb(std::array<uint64_t, 25> &st, size_t const i, uint8_t const b)
    {
        st[i / 8] ^= uint64_t{b} << (8 * (i % 8));
    }

    // Original Keccak padding (0x01), not the SHA3 domain byte.
    constexpr std::array<uint8_t, 32> keccak256(std::string_view const input)
    {
        std::array<uint64_t, 25> st{};
        size_t offset = 0;
        while (input.size() - offset >= KECCAK_RATE) {
            for (size_t i = 0; i < KECCAK_RATE; ++i) {
                keccak_absorb(st, i, static_cast<uint8_t>(input[offset + i]));
            }
            keccak_f1600(st);
            offset += KECCAK_RATE;
        }
        size_t const tail = input.size() - offset;
        for (size_t i = 0; i < tail; ++i) {
            keccak_absorb(st, i, static_cast<uint8_t>(input[offset + i]));
        }
        keccak_absorb(st, tail, 0x01);
        keccak_absorb(st, KECCAK_RATE - 1, 0x80);
        keccak_f1600(st);

        std::array<uint8_t, 32> out{};
        for (size_t i = 0; i < out.size(); ++i) {
            out[i] = static_cast<uint8_t>(st[i / 8] >> (8 * (i % 8)));
        }
        return out;
    }
}

constexpr uint32_t abi_encode_selector(std::string_view const signature)
{
    auto const hash = detail::keccak256(signature);
    return (uint32_t{hash[0]} << 24) | (uint32_t{hash[1]} << 16) |
           (uint32_t{hash[2]} << 8) | uint32_t{hash[3]};
}

inline constexpr uint32_t TOTAL_SUPPLY_SELECTOR =
    abi_encode_selector("totalSupply()");
static_assert(TOTAL_SUPPLY_SELECTOR == 0x18160ddd);

inline constexpr uint32_t BALANCE_OF_SELECTOR =
    abi_encode_selector("balanceOf(address)");
static_assert(BALANCE_OF_SELECTOR == 0x70a08231);

inline constexpr uint32_t ALLOWANCE_SELECTOR =
    abi_encode_selector("allowance(address,address)");
static_assert(ALLOWANCE_SELECTOR == 0xdd62ed3e);

inline constexpr uint32_t TRANSFER_SELECTOR =
    abi_encode_selector("transfer(address,uint256)");
static_assert(TRANSFER_SELECTOR == 0xa9059cbb);

inline constexpr uint32_t TRANSFER_FROM_SELECTOR =
    abi_encode_selector("transferFrom(address,address,uint256)");
static_assert(TRANSFER_FROM_SELECTOR == 0x23b872dd);

inline constexpr uint32_t APPROVE_SELECTOR =
    abi_encode_selector("approve(address,uint256)");
static_assert(APPROVE_SELECTOR == 0x095ea7b3);

STDPROP_NAMESPACE_END
