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

#include <stdprop/property/property.hpp>

#include <magic_enum.hpp>

#include <string_view>

STDPROP_NAMESPACE_BEGIN

std::string_view to_string(Operation const op)
{
    switch (op) {
    case Operation::TotalSupply:
        return "totalSupply";
    case Operation::BalanceOf:
        return "balanceOf";
    case Operation::Allowance:
        return "allowance";
    case Operation::Transfer:
        return "transfer";
    case Operation::TransferFrom:
        return "transferFrom";
    case Operation::Approve:
        return "approve";
    }
    return magic_enum::enum_name(op);
}

std::string_view to_string(CallMode const mode)
{
    return magic_enum::enum_name(mode);
}

bool is_mutating(Operation const op)
{
    return op == Operation::Transfer || op == Operation::TransferFrom ||
           op == Operation::Approve;
}

STDPROP_NAMESPACE_END
