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

#include <fuelcall/core/config.hpp>

#include <string>
#include <vector>

FUELCALL_NAMESPACE_BEGIN

// Position inside a schema tree, e.g. `arg1.Cocktail.glass` or
// `arg0.[2].<Mojito>`. Used to report which argument or return field an
// encode or decode failure belongs to.
class SchemaPath
{
    std::vector<std::string> segments_;

public:
    class Scope
    {
        SchemaPath &path_;

    public:
        Scope(SchemaPath &path, std::string segment)
            : path_{path}
        {
            path_.segments_.push_back(std::move(segment));
        }

        ~Scope()
        {
            path_.segments_.pop_back();
        }

        Scope(Scope const &) = delete;
        Scope &operator=(Scope const &) = delete;
    };

    std::string to_string() const
    {
        if (segments_.empty()) {
            return "$";
        }
        std::string out;
        for (auto const &segment : segments_) {
            if (!out.empty()) {
                out += '.';
            }
            out += segment;
        }
        return out;
    }
};

FUELCALL_NAMESPACE_END
