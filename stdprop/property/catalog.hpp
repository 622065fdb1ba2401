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
#include <stdprop/property/property.hpp>

#include <span>
#include <string_view>

STDPROP_NAMESPACE_BEGIN

// All properties, ordered by id
std::span<Property const> catalog();

// Accepts the full id or its number, e.g. "ERC20-STDPROP-07" or "07"
Property const *find_property(std::string_view id);

std::span<Property const> read_properties();
std::span<Property const> transfer_properties();
std::span<Property const> transfer_from_properties();
std::span<Property const> approve_properties();

STDPROP_NAMESPACE_END
