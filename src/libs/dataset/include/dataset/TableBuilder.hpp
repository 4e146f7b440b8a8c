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

#include "dataset/DatasetInfo.hpp"
#include "dataset/RawTable.hpp"
#include "dataset/RecordSet.hpp"
#include "dataset/Schema.hpp"
#include "dataset/Types.hpp"

namespace rekit::dataset
{
    // Turns raw tables into record sets, owns the DatasetInfo
    // All the build methods throw MalformedInputException and never produce partial record sets
    class TableBuilder
    {
    public:
        TableBuilder(const Schema& schema, Task task);
        ~TableBuilder() = default;
        TableBuilder(const TableBuilder&) = delete;
        TableBuilder& operator=(const TableBuilder&) = delete;

        // Registers unseen users, items and categorical values. Can be called again to
        // train incrementally on new data: existing indices are kept
        RecordSet buildTrainSet(const RawTable& table);

        // No new index is created, unknown users and items are left unresolved
        RecordSet buildEvalSet(const RawTable& table) const;
        RecordSet buildTestSet(const RawTable& table) const;

        const DatasetInfo& getDatasetInfo() const { return _datasetInfo; }

    private:
        DatasetInfo _datasetInfo;
    };
} // namespace rekit::dataset
