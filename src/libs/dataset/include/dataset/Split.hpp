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

#include <cstdint>
#include <optional>
#include <string_view>
#include <utility>
#include <vector>

#include "dataset/RawTable.hpp"
#include "dataset/Schema.hpp"

namespace rekit::dataset
{
    struct RandomSplitParameters
    {
        std::vector<double> ratios{ 0.8, 0.2 }; // must sum to 1
        std::uint_fast32_t seed{ 42 };
        bool filterUnknown{}; // drop rows of the other splits whose user or item is not in the first one
    };

    // Shuffles the rows and cuts them according to the ratios
    std::vector<RawTable> splitRandom(const RawTable& table, const Schema& schema, const RandomSplitParameters& params);

    struct ChronoSplitParameters
    {
        double testRatio{ 0.2 };
        bool perUser{}; // take the trailing fraction of each user instead of the whole table
    };

    // Sorts by the schema time column, the trailing fraction goes to the second table
    std::pair<RawTable, RawTable> splitChrono(const RawTable& table, const Schema& schema, const ChronoSplitParameters& params);

    // Leave-k-out: testCount random rows of each user go to the second table, users keep at least one train row
    std::pair<RawTable, RawTable> splitByCount(const RawTable& table, const Schema& schema, std::size_t testCount, std::uint_fast32_t seed);

    // Epoch seconds or ISO 8601 date time
    std::optional<long long> parseTimestamp(std::string_view str);
} // namespace rekit::dataset
