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

#include "dataset/RawTable.hpp"

#include <algorithm>
#include <fstream>
#include <istream>

#include "core/ILogger.hpp"
#include "core/String.hpp"
#include "dataset/Exception.hpp"

namespace rekit::dataset
{
    namespace
    {
        RawTable::Row splitLine(std::string_view line, char delimiter)
        {
            RawTable::Row row;
            for (std::string_view cell : core::stringUtils::splitString(line, delimiter))
                row.emplace_back(core::stringUtils::stringTrim(cell));

            return row;
        }
    } // namespace

    RawTable::RawTable(std::vector<std::string> columnNames)
        : _columnNames{ std::move(columnNames) }
    {
    }

    std::optional<std::size_t> RawTable::findColumn(std::string_view name) const
    {
        const auto it{ std::find(std::cbegin(_columnNames), std::cend(_columnNames), name) };
        if (it == std::cend(_columnNames))
            return std::nullopt;

        return std::distance(std::cbegin(_columnNames), it);
    }

    std::size_t RawTable::getColumnIndex(std::string_view name) const
    {
        const std::optional<std::size_t> index{ findColumn(name) };
        if (!index)
            throw Exception{ "Column '" + std::string{ name } + "' not found" };

        return *index;
    }

    void RawTable::addRow(Row row)
    {
        _rows.emplace_back(std::move(row));
    }

    RawTable RawTable::selectRows(std::span<const std::size_t> rowIds) const
    {
        RawTable res{ _columnNames };
        res._rows.reserve(rowIds.size());
        for (std::size_t rowId : rowIds)
            res._rows.push_back(_rows[rowId]);

        return res;
    }

    std::vector<std::string> getDefaultColumnNames(std::size_t columnCount)
    {
        std::vector<std::string> names;
        for (std::size_t i{}; i < columnCount; ++i)
        {
            switch (i)
            {
            case 0:
                names.emplace_back("user");
                break;
            case 1:
                names.emplace_back("item");
                break;
            case 2:
                names.emplace_back("label");
                break;
            default:
                names.emplace_back("col" + std::to_string(i));
            }
        }

        return names;
    }

    RawTable readTable(std::istream& is, const ReadParameters& params)
    {
        RawTable table;
        bool first{ true };
        std::size_t lineCount{};

        std::string line;
        while (std::getline(is, line))
        {
            ++lineCount;
            if (core::stringUtils::stringTrim(line).empty())
                continue;

            RawTable::Row row{ splitLine(line, params.delimiter) };
            if (first)
            {
                first = false;
                if (params.hasHeader)
                {
                    table = RawTable{ std::move(row) };
                    continue;
                }

                table = RawTable{ getDefaultColumnNames(row.size()) };
            }

            // short rows are kept as is, missing cells are reported by the builders
            if (row.size() > table.getColumnCount())
                throw Exception{ "Line " + std::to_string(lineCount) + " has " + std::to_string(row.size()) + " cells, expected at most " + std::to_string(table.getColumnCount()) };

            table.addRow(std::move(row));
        }

        if (is.bad())
            throw Exception{ "Read error after line " + std::to_string(lineCount) };

        REKIT_LOG(DATASET, DEBUG, "Read " << table.getRowCount() << " rows, " << table.getColumnCount() << " columns");
        return table;
    }

    RawTable readTable(const std::filesystem::path& path, const ReadParameters& params)
    {
        std::ifstream ifs{ path };
        if (!ifs)
            throw Exception{ "Cannot open file '" + path.string() + "'" };

        REKIT_LOG(DATASET, INFO, "Reading '" << path.string() << "'");
        return readTable(ifs, params);
    }
} // namespace rekit::dataset
