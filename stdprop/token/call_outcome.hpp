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

#include <stdprop/core/byte_string.hpp>
#include <stdprop/core/config.hpp>
#include <stdprop/core/int.hpp>

#include <cstdint>
#include <optional>
#include <string>

STDPROP_NAMESPACE_BEGIN

// Observed result of a raw call. A completed call carries its return data;
// return_value is the decoded bool when the data is exactly one valid bool
// word and empty otherwise.
struct CallOutcome
{
    enum class Status : uint8_t
    {
        Reverted,
        Completed,
    };

    Status status{Status::Reverted};
    std::optional<bool> return_value{};
    byte_string output{};

    bool is_reverted() const noexcept
    {
        return status == Status::Reverted;
    }

    bool is_completed() const noexcept
    {
        return status == Status::Completed;
    }

    bool returned_true() const noexcept
    {
        return is_completed() && return_value == true;
    }

    bool returned_false() const noexcept
    {
        return is_completed() && return_value == false;
    }

    // Completed without a decodable bool
    bool returned_malformed() const noexcept
    {
        return is_completed() && !return_value.has_value();
    }

    // Output decoded as a single uint256 word, for reads
    std::optional<uint256_t> word() const;

    // Revert payload as text
    std::string revert_reason() const;

    bool operator==(CallOutcome const &) const = default;
};

std::string to_string(CallOutcome const &);

STDPROP_NAMESPACE_END
