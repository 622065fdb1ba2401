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

#include <stdprop/core/assert.h>
#include <stdprop/property/catalog.hpp>
#include <stdprop/property/property.hpp>

#include <algorithm>
#include <span>
#include <string>
#include <string_view>
#include <vector>

STDPROP_ANONYMOUS_NAMESPACE_BEGIN

constexpr std::string_view ID_PREFIX = "ERC20-STDPROP-";

std::vector<Property> build_catalog()
{
    std::vector<Property> all;
    for (auto const group :
         {read_properties(),
          transfer_properties(),
          transfer_from_properties(),
          approve_properties()}) {
        all.insert(all.end(), group.begin(), group.end());
    }
    std::ranges::sort(all, {}, &Property::id);
    STDPROP_ASSERT(
        std::ranges::adjacent_find(all, {}, &Property::id) == all.end());
    return all;
}

STDPROP_ANONYMOUS_NAMESPACE_END

STDPROP_NAMESPACE_BEGIN

std::span<Property const> catalog()
{
    static std::vector<Property> const all = build_catalog();
    return all;
}

Property const *find_property(std::string_view const id)
{
    std::string full{id};
    if (!id.starts_with(ID_PREFIX)) {
        full = std::string{ID_PREFIX};
        if (id.size() == 1) {
            full.push_back('0');
        }
        full.append(id);
    }
    auto const all = catalog();
    auto const it = std::ranges::find(all, full, &Property::id);
    return it == all.end() ? nullptr : &*it;
}

STDPROP_NAMESPACE_END
