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

#include <stdprop/core/byte_string.hpp>
#include <stdprop/core/fmt/int_fmt.hpp>
#include <stdprop/core/int.hpp>
#include <stdprop/token/abi/abi_decode.hpp>
#include <stdprop/token/call_outcome.hpp>

#include <fmt/format.h>

#include <optional>
#include <string>

STDPROP_NAMESPACE_BEGIN

std::optional<uint256_t> CallOutcome::word() const
{
    if (!is_completed()) {
        return std::nullopt;
    }
    byte_string_view input{output};
    auto const value = abi_decode_uint(input);
    if (value.has_error() || !input.empty()) {
        return std::nullopt;
    }
    return value.assume_value();
}

std::string CallOutcome::revert_reason() const
{
    if (!is_reverted()) {
        return {};
    }
    return std::string{output.begin(), output.end()};
}

std::string to_string(CallOutcome const &outcome)
{
    if (outcome.is_reverted()) {
        auto const reason = outcome.revert_reason();
        return reason.empty() ? "Reverted"
                              : fmt::format("Reverted(\"{}\")", reason);
    }
    if (outcome.return_value.has_value()) {
        return fmt::format("Completed({})", *outcome.return_value);
    }
    if (auto const w = outcome.word(); w.has_value()) {
        return fmt::format("Completed({})", *w);
    }
    return fmt::format("Completed(<{} bytes>)", outcome.output.size());
}

STDPROP_NAMESPACE_END
