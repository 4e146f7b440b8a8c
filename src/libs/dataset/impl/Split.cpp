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

#include "dataset/Split.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>
#include <unordered_map>
#include <unordered_set>

#include <Wt/WDateTime.h>

#include "core/ILogger.hpp"
#include "core/Random.hpp"
#include "core/String.hpp"
#include "dataset/Exception.hpp"

namespace rekit::dataset
{
    namespace
    {
        const std::string& getCell(const RawTable& table, std::size_t rowId, std::size_t column)
        {
            const RawTable::Row& row{ table.getRow(rowId) };
            if (column >= row.size() || row[column].empty())
                throw MalformedInputException{ rowId, table.getColumnNames()[column], "missing value" };

            return row[column];
        }

        // row ids of each user, users in first-seen order
        std::vector<std::vector<std::size_t>> groupRowsByUser(const RawTable& table, const Schema& schema)
        {
            const std::size_t userColumn{ getUserIdColumn(schema, table) };

            std::vector<std::vector<std::size_t>> res;
            std::unordered_map<std::string_view, std::size_t> userPositions;
            for (std::size_t rowId{}; rowId < table.getRowCount(); ++rowId)
            {
                auto [it, inserted]{ userPositions.try_emplace(getCell(table, rowId, userColumn), res.size()) };
                if (inserted)
                    res.emplace_back();

                res[it->second].push_back(rowId);
            }

            return res;
        }

        std::vector<long long> getTimestamps(const RawTable& table, const Schema& schema)
        {
            if (!schema.timeColumn)
                throw Exception{ "Chronological split requires a time column" };

            const std::size_t timeColumn{ table.getColumnIndex(*schema.timeColumn) };

            std::vector<long long> timestamps;
            timestamps.reserve(table.getRowCount());
            for (std::size_t rowId{}; rowId < table.getRowCount(); ++rowId)
            {
                const std::string& cell{ getCell(table, rowId, timeColumn) };
                const std::optional<long long> timestamp{ parseTimestamp(cell) };
                if (!timestamp)
                    throw MalformedInputException{ rowId, *schema.timeColumn, "'" + cell + "' is not a timestamp" };

                timestamps.push_back(*timestamp);
            }

            return timestamps;
        }

        std::size_t getTrailingCount(std::size_t count, double ratio)
        {
            return static_cast<std::size_t>(std::round(static_cast<double>(count) * ratio));
        }
    } // namespace

    std::optional<long long> parseTimestamp(std::string_view str)
    {
        if (std::optional<long long> epoch{ core::stringUtils::readAs<long long>(str) })
            return epoch;

        const Wt::WDateTime dateTime{ core::stringUtils::fromISO8601String(str) };
        if (!dateTime.isValid())
            return std::nullopt;

        return static_cast<long long>(dateTime.toTime_t());
    }

    std::vector<RawTable> splitRandom(const RawTable& table, const Schema& schema, const RandomSplitParameters& params)
    {
        if (params.ratios.empty())
            throw Exception{ "No split ratio given" };
        if (std::any_of(std::cbegin(params.ratios), std::cend(params.ratios), [](double ratio) { return ratio <= 0 || ratio > 1; }))
            throw Exception{ "Split ratios must be in ]0, 1]" };
        if (std::abs(std::accumulate(std::cbegin(params.ratios), std::cend(params.ratios), 0.) - 1) > 1e-6)
            throw Exception{ "Split ratios must sum to 1" };

        std::vector<std::size_t> rowIds(table.getRowCount());
        std::iota(std::begin(rowIds), std::end(rowIds), std::size_t{ 0 });

        core::random::RandGenerator generator{ core::random::createSeededGenerator(params.seed) };
        core::random::shuffleContainer(rowIds, generator);

        std::vector<std::vector<std::size_t>> splitRowIds;
        double cumulatedRatio{};
        std::size_t begin{};
        for (std::size_t i{}; i < params.ratios.size(); ++i)
        {
            cumulatedRatio += params.ratios[i];
            // ratios may sum slightly above 1
            const std::size_t end{ i + 1 == params.ratios.size() ? rowIds.size() : std::min(getTrailingCount(rowIds.size(), cumulatedRatio), rowIds.size()) };

            splitRowIds.emplace_back(std::next(std::cbegin(rowIds), begin), std::next(std::cbegin(rowIds), std::max(begin, end)));
            begin = std::max(begin, end);
        }

        if (params.filterUnknown && splitRowIds.size() > 1)
        {
            const std::size_t userColumn{ getUserIdColumn(schema, table) };
            const std::size_t itemColumn{ getItemIdColumn(schema, table) };

            std::unordered_set<std::string_view> trainUsers;
            std::unordered_set<std::string_view> trainItems;
            for (std::size_t rowId : splitRowIds.front())
            {
                trainUsers.insert(getCell(table, rowId, userColumn));
                trainItems.insert(getCell(table, rowId, itemColumn));
            }

            for (std::size_t i{ 1 }; i < splitRowIds.size(); ++i)
            {
                std::vector<std::size_t>& ids{ splitRowIds[i] };
                const std::size_t prevSize{ ids.size() };
                ids.erase(std::remove_if(std::begin(ids), std::end(ids), [&](std::size_t rowId) {
                    return !trainUsers.contains(getCell(table, rowId, userColumn)) || !trainItems.contains(getCell(table, rowId, itemColumn));
                }),
                    std::end(ids));

                REKIT_LOG_IF(SPLIT, DEBUG, prevSize != ids.size(), "Split " << i << ": removed " << (prevSize - ids.size()) << " rows with unknown user or item");
            }
        }

        std::vector<RawTable> res;
        for (const std::vector<std::size_t>& ids : splitRowIds)
            res.push_back(table.selectRows(ids));

        return res;
    }

    std::pair<RawTable, RawTable> splitChrono(const RawTable& table, const Schema& schema, const ChronoSplitParameters& params)
    {
        if (params.testRatio <= 0 || params.testRatio >= 1)
            throw Exception{ "Test ratio must be in ]0, 1[" };

        const std::vector<long long> timestamps{ getTimestamps(table, schema) };
        auto sortByTime{ [&](std::vector<std::size_t>& rowIds) {
            std::stable_sort(std::begin(rowIds), std::end(rowIds), [&](std::size_t lhs, std::size_t rhs) { return timestamps[lhs] < timestamps[rhs]; });
        } };

        std::vector<std::size_t> trainRowIds;
        std::vector<std::size_t> testRowIds;

        if (params.perUser)
        {
            for (std::vector<std::size_t>& userRowIds : groupRowsByUser(table, schema))
            {
                sortByTime(userRowIds);

                std::size_t testCount{ getTrailingCount(userRowIds.size(), params.testRatio) };
                if (testCount == userRowIds.size())
                    testCount -= 1;

                const auto itSplit{ std::prev(std::cend(userRowIds), testCount) };
                trainRowIds.insert(std::end(trainRowIds), std::cbegin(userRowIds), itSplit);
                testRowIds.insert(std::end(testRowIds), itSplit, std::cend(userRowIds));
            }

            sortByTime(trainRowIds);
            sortByTime(testRowIds);
        }
        else
        {
            std::vector<std::size_t> rowIds(table.getRowCount());
            std::iota(std::begin(rowIds), std::end(rowIds), std::size_t{ 0 });
            sortByTime(rowIds);

            const auto itSplit{ std::prev(std::cend(rowIds), getTrailingCount(rowIds.size(), params.testRatio)) };
            trainRowIds.assign(std::cbegin(rowIds), itSplit);
            testRowIds.assign(itSplit, std::cend(rowIds));
        }

        REKIT_LOG(SPLIT, DEBUG, "Chronological split: " << trainRowIds.size() << " train rows, " << testRowIds.size() << " test rows");
        return { table.selectRows(trainRowIds), table.selectRows(testRowIds) };
    }

    std::pair<RawTable, RawTable> splitByCount(const RawTable& table, const Schema& schema, std::size_t testCount, std::uint_fast32_t seed)
    {
        if (testCount == 0)
            throw Exception{ "Test count must be positive" };

        core::random::RandGenerator generator{ core::random::createSeededGenerator(seed) };

        std::vector<std::size_t> trainRowIds;
        std::vector<std::size_t> testRowIds;
        for (std::vector<std::size_t>& userRowIds : groupRowsByUser(table, schema))
        {
            if (userRowIds.size() <= testCount)
            {
                trainRowIds.insert(std::end(trainRowIds), std::cbegin(userRowIds), std::cend(userRowIds));
                continue;
            }

            core::random::shuffleContainer(userRowIds, generator);
            testRowIds.insert(std::end(testRowIds), std::cbegin(userRowIds), std::next(std::cbegin(userRowIds), testCount));
            trainRowIds.insert(std::end(trainRowIds), std::next(std::cbegin(userRowIds), testCount), std::cend(userRowIds));
        }

        // keep the original row order
        std::sort(std::begin(trainRowIds), std::end(trainRowIds));
        std::sort(std::begin(testRowIds), std::end(testRowIds));

        return { table.selectRows(trainRowIds), table.selectRows(testRowIds) };
    }
} // namespace rekit::dataset
