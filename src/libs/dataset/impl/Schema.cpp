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

#include "dataset/Schema.hpp"

#include <algorithm>
#include <unordered_set>

#include "dataset/Exception.hpp"
#include "dataset/RawTable.hpp"

namespace rekit::dataset
{
    namespace
    {
        bool contains(const std::vector<std::string>& columns, std::string_view column)
        {
            return std::find(std::cbegin(columns), std::cend(columns), column) != std::cend(columns);
        }

        std::size_t getIdColumn(const RawTable& table, const std::optional<std::string>& name, std::size_t position, std::string_view what)
        {
            if (name)
                return table.getColumnIndex(*name);
            if (position >= table.getColumnCount())
                throw Exception{ "No " + std::string{ what } + " column in table" };

            return position;
        }
    } // namespace

    void Schema::validate() const
    {
        std::unordered_set<std::string_view> featureColumns;
        for (const std::vector<std::string>* columns : { &sparseColumns, &multiSparseColumns, &denseColumns })
        {
            for (const std::string& column : *columns)
            {
                if (!featureColumns.insert(column).second)
                    throw Exception{ "Column '" + column + "' is declared more than once in sparse, multi-sparse and dense columns" };
            }
        }

        for (const std::string& column : userColumns)
        {
            if (contains(itemColumns, column))
                throw Exception{ "Column '" + column + "' cannot be both user and item associated" };
            if (!featureColumns.contains(column))
                throw Exception{ "User column '" + column + "' is not declared as a feature column" };
        }

        for (const std::string& column : itemColumns)
        {
            if (!featureColumns.contains(column))
                throw Exception{ "Item column '" + column + "' is not declared as a feature column" };
        }

        for (const auto& [column, maxWidth] : multiSparseMaxWidths)
        {
            if (!contains(multiSparseColumns, column))
                throw Exception{ "Max width given for column '" + column + "', which is not a multi-sparse column" };
            if (maxWidth == 0)
                throw Exception{ "Max width of column '" + column + "' must be positive" };
        }

        for (const std::optional<std::string>* idColumn : { &userIdColumn, &itemIdColumn, &labelColumn, &timeColumn })
        {
            if (*idColumn && featureColumns.contains(**idColumn))
                throw Exception{ "Column '" + **idColumn + "' cannot be used both as a feature and as an id, label or time column" };
        }
    }

    bool Schema::isFeatureColumn(std::string_view column) const
    {
        return contains(sparseColumns, column) || contains(multiSparseColumns, column) || contains(denseColumns, column);
    }

    FieldAssociation Schema::getAssociation(std::string_view column) const
    {
        if (contains(userColumns, column))
            return FieldAssociation::User;
        if (contains(itemColumns, column))
            return FieldAssociation::Item;

        return FieldAssociation::None;
    }

    std::size_t getUserIdColumn(const Schema& schema, const RawTable& table)
    {
        return getIdColumn(table, schema.userIdColumn, 0, "user");
    }

    std::size_t getItemIdColumn(const Schema& schema, const RawTable& table)
    {
        return getIdColumn(table, schema.itemIdColumn, 1, "item");
    }
} // namespace rekit::dataset
