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

#include <cstddef>
#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <string_view>

namespace rekit::dataset
{
    // Dense zero-based index of a user or an item
    using Index = std::size_t;
    static constexpr Index invalidIndex{ std::numeric_limits<Index>::max() };

    using RawId = std::string;

    // Field-local index of a categorical value, 0 is reserved for unknown values and padding
    using FeatureIndex = std::uint32_t;
    static constexpr FeatureIndex unknownFeatureIndex{ 0 };

    enum class EntityType
    {
        User,
        Item,
    };
    const char* getEntityTypeName(EntityType type);

    enum class Task
    {
        Rating,  // explicit feedback, labels are ratings
        Ranking, // implicit feedback, labels are 1 (positive) or 0 (negative)
    };
    const char* getTaskName(Task task);
    std::optional<Task> parseTask(std::string_view str);
} // namespace rekit::dataset
