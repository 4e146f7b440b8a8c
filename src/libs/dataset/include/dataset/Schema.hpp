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

#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace rekit::dataset
{
    class RawTable;

    enum class FieldAssociation
    {
        None,
        User, // value shared by all the rows of a user
        Item, // value shared by all the rows of an item
    };

    // Declares how the columns of a raw table are to be interpreted
    struct Schema
    {
        std::vector<std::string> sparseColumns;      // categorical, one value per cell
        std::vector<std::string> multiSparseColumns; // categorical, several values per cell
        std::vector<std::string> denseColumns;       // numeric
        std::vector<std::string> userColumns;
        std::vector<std::string> itemColumns;

        // Max number of values kept for multi-valued columns, observed on the first training set if absent
        std::unordered_map<std::string, std::size_t> multiSparseMaxWidths;
        char multiValueSeparator{ '|' };
        bool standardizeDense{};

        // If not set, user, item and label are the columns 0, 1 and 2
        std::optional<std::string> userIdColumn;
        std::optional<std::string> itemIdColumn;
        std::optional<std::string> labelColumn;
        std::optional<std::string> timeColumn;

        // throws dataset::Exception
        void validate() const;

        FieldAssociation getAssociation(std::string_view column) const;
        bool hasFeatures() const { return !sparseColumns.empty() || !multiSparseColumns.empty() || !denseColumns.empty(); }
        bool isFeatureColumn(std::string_view column) const;
    };

    // Position of the id columns in a table, throw dataset::Exception if absent
    std::size_t getUserIdColumn(const Schema& schema, const RawTable& table);
    std::size_t getItemIdColumn(const Schema& schema, const RawTable& table);
} // namespace rekit::dataset
