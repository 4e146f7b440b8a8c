/*
 * Copyright (C) 2024 Emeric Poupon
 *
 * This file is part of Rekit.
 *
 * Rekit is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * Rekit is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with Rekit.  If not, see <http://www.gnu.org/licenses/>.
 */

#pragma once

#include <sstream>
#include <string_view>

#include "dataset/RawTable.hpp"

namespace rekit::dataset::tests
{
    inline RawTable parseTable(std::string_view content, bool hasHeader = true)
    {
        std::istringstream iss{ std::string{ content } };
        return readTable(iss, ReadParameters{ .delimiter = ',', .hasHeader = hasHeader });
    }
} // namespace rekit::dataset::tests
