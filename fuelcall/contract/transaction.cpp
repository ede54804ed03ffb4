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

#include <fuelcall/contract/transaction.hpp>

#include <algorithm>
#include <variant>

FUELCALL_NAMESPACE_BEGIN

size_t count_variable_outputs(ScriptTransaction const &tx)
{
    return static_cast<size_t>(
        std::ranges::count_if(tx.outputs, [](Output const &output) {
            return std::holds_alternative<VariableOutput>(output);
        }));
}

FUELCALL_NAMESPACE_END
