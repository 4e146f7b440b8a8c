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

#include "dataset/Types.hpp"

#include "core/String.hpp"

namespace rekit::dataset
{
    const char* getEntityTypeName(EntityType type)
    {
        switch (type)
        {
        case EntityType::User:
            return "user";
        case EntityType::Item:
            return "item";
        }
        return "";
    }

    const char* getTaskName(Task task)
    {
        switch (task)
        {
        case Task::Rating:
            return "rating";
        case Task::Ranking:
            return "ranking";
        }
        return "";
    }

    std::optional<Task> parseTask(std::string_view str)
    {
        for (Task task : { Task::Rating, Task::Ranking })
        {
            if (core::stringUtils::stringCaseInsensitiveEqual(str, getTaskName(task)))
                return task;
        }

        return std::nullopt;
    }
} // namespace rekit::dataset
