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

#include "dataset/TableBuilder.hpp"

#include <cmath>
#include <optional>

#include "core/ILogger.hpp"
#include "core/String.hpp"
#include "dataset/Exception.hpp"

namespace rekit::dataset
{
    namespace
    {
        struct IdColumns
        {
            std::size_t user;
            std::size_t item;
            std::optional<std::size_t> label;
        };

        IdColumns resolveIdColumns(const RawTable& table, const Schema& schema, Task task)
        {
            IdColumns columns;
            columns.user = getUserIdColumn(schema, table);
            columns.item = getItemIdColumn(schema, table);

            if (schema.labelColumn)
            {
                columns.label = table.getColumnIndex(*schema.labelColumn);
            }
            else if (table.getColumnCount() > 2)
            {
                const std::string& column{ table.getColumnNames()[2] };
                if (!schema.isFeatureColumn(column) && schema.timeColumn != column)
                    columns.label = 2;
            }

            if (!columns.label && task == Task::Rating)
                throw Exception{ "No label column in table, required by rating tasks" };

            return columns;
        }

        // Row validated, not yet committed to the dataset info
        struct StagedRow
        {
            std::string_view user;
            std::string_view item;
            double label;
            RawFeatures features;
        };

        std::string_view getIdCell(const RawTable& table, const RawTable::Row& row, std::size_t column, std::size_t rowId)
        {
            if (column >= row.size() || row[column].empty())
                throw MalformedInputException{ rowId, table.getColumnNames()[column], "missing value" };

            return row[column];
        }

        std::vector<StagedRow> stageRows(const RawTable& table, const Schema& schema, Task task, const FeatureEncoder& encoder)
        {
            const IdColumns idColumns{ resolveIdColumns(table, schema, task) };
            const FeatureColumns featureColumns{ encoder.bindColumns(table) };

            std::vector<StagedRow> stagedRows;
            stagedRows.reserve(table.getRowCount());

            for (std::size_t rowId{}; rowId < table.getRowCount(); ++rowId)
            {
                const RawTable::Row& row{ table.getRow(rowId) };

                StagedRow& stagedRow{ stagedRows.emplace_back() };
                stagedRow.user = getIdCell(table, row, idColumns.user, rowId);
                stagedRow.item = getIdCell(table, row, idColumns.item, rowId);

                stagedRow.label = 1;
                if (idColumns.label)
                {
                    const std::string_view cell{ getIdCell(table, row, *idColumns.label, rowId) };
                    const std::optional<double> label{ core::stringUtils::readAs<double>(cell) };
                    if (!label || !std::isfinite(*label))
                        throw MalformedInputException{ rowId, table.getColumnNames()[*idColumns.label], "'" + std::string{ cell } + "' is not a finite number" };

                    // implicit feedback: any positive label is an observed interaction
                    stagedRow.label = (task == Task::Ranking) ? (*label > 0 ? 1 : 0) : *label;
                }

                stagedRow.features = encoder.parse(row, featureColumns, rowId);
            }

            return stagedRows;
        }

        RecordColumns createColumns(const FeatureEncoder& encoder, std::size_t rowCount)
        {
            RecordColumns columns;
            columns.sparseFieldCount = encoder.getSparseFields().size();
            columns.multiSparseWidth = encoder.getMultiSparseWidth();
            columns.denseFieldCount = encoder.getDenseFields().size();

            columns.userIndices.reserve(rowCount);
            columns.itemIndices.reserve(rowCount);
            columns.labels.reserve(rowCount);
            columns.negativeKinds.reserve(rowCount);

            return columns;
        }

        RecordSet buildInferenceSet(const DatasetInfo& datasetInfo, const RawTable& table, std::string_view setName)
        {
            const FeatureEncoder& encoder{ datasetInfo.getFeatureEncoder() };
            const IdentifierRegistry& registry{ datasetInfo.getRegistry() };

            const std::vector<StagedRow> stagedRows{ stageRows(table, datasetInfo.getSchema(), datasetInfo.getTask(), encoder) };

            RecordColumns columns{ createColumns(encoder, stagedRows.size()) };
            for (std::size_t rowId{}; rowId < stagedRows.size(); ++rowId)
            {
                const StagedRow& stagedRow{ stagedRows[rowId] };

                const std::optional<Index> user{ registry.findIndex(EntityType::User, stagedRow.user) };
                if (!user)
                    columns.unresolvedUsers.emplace(rowId, stagedRow.user);

                const std::optional<Index> item{ registry.findIndex(EntityType::Item, stagedRow.item) };
                if (!item)
                    columns.unresolvedItems.emplace(rowId, stagedRow.item);

                columns.append(user.value_or(invalidIndex), item.value_or(invalidIndex), stagedRow.label, NegativeKind::None, encoder.encode(stagedRow.features));
            }

            RecordSet res{ std::move(columns) };
            REKIT_LOG(DATASET, INFO, "Built " << setName << " set: " << res.size() << " records, " << res.getUnresolvedCount() << " with unknown user or item");

            return res;
        }
    } // namespace

    TableBuilder::TableBuilder(const Schema& schema, Task task)
        : _datasetInfo{ schema, task }
    {
    }

    RecordSet TableBuilder::buildTrainSet(const RawTable& table)
    {
        // Validate everything first so that a malformed table leaves the dataset info untouched
        const std::vector<StagedRow> stagedRows{ stageRows(table, _datasetInfo.getSchema(), _datasetInfo.getTask(), _datasetInfo.getFeatureEncoder()) };

        const std::size_t prevUserCount{ _datasetInfo.getUserCount() };
        const std::size_t prevItemCount{ _datasetInfo.getItemCount() };

        FeatureEncoder& encoder{ _datasetInfo.getFeatureEncoder() };
        {
            std::vector<RawFeatures> samples;
            samples.reserve(stagedRows.size());
            for (const StagedRow& stagedRow : stagedRows)
                samples.push_back(stagedRow.features);

            encoder.fit(samples);
            encoder.freeze();
        }

        IdentifierRegistry& registry{ _datasetInfo.getRegistry() };
        RecordColumns columns{ createColumns(encoder, stagedRows.size()) };
        for (const StagedRow& stagedRow : stagedRows)
        {
            const Index user{ registry.getOrCreateIndex(EntityType::User, stagedRow.user) };
            const Index item{ registry.getOrCreateIndex(EntityType::Item, stagedRow.item) };
            const EncodedFeatures features{ encoder.encode(stagedRow.features) };

            _datasetInfo.addInteraction(user, item, stagedRow.label, features);
            columns.append(user, item, stagedRow.label, NegativeKind::None, features);
        }
        _datasetInfo.refreshStatistics();

        REKIT_LOG(DATASET, INFO, "Built train set: " << stagedRows.size() << " records, "
                                                    << (_datasetInfo.getUserCount() - prevUserCount) << " new users, "
                                                    << (_datasetInfo.getItemCount() - prevItemCount) << " new items");
        REKIT_LOG(DATASET, DEBUG, _datasetInfo);

        return RecordSet{ std::move(columns) };
    }

    RecordSet TableBuilder::buildEvalSet(const RawTable& table) const
    {
        return buildInferenceSet(_datasetInfo, table, "eval");
    }

    RecordSet TableBuilder::buildTestSet(const RawTable& table) const
    {
        return buildInferenceSet(_datasetInfo, table, "test");
    }
} // namespace rekit::dataset
