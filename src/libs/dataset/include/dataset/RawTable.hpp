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

#include <filesystem>
#include <iosfwd>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace rekit::dataset
{
    // Raw delimited text, cells are kept as read
    class RawTable
    {
    public:
        using Row = std::vector<std::string>;

        RawTable() = default;
        explicit RawTable(std::vector<std::string> columnNames);

        const std::vector<std::string>& getColumnNames() const { return _columnNames; }
        std::size_t getColumnCount() const { return _columnNames.size(); }
        std::optional<std::size_t> findColumn(std::string_view name) const;
        std::size_t getColumnIndex(std::string_view name) const; // throws dataset::Exception if not found

        void addRow(Row row);
        std::size_t getRowCount() const { return _rows.size(); }
        bool empty() const { return _rows.empty(); }
        const Row& getRow(std::size_t rowId) const { return _rows[rowId]; }
        const std::vector<Row>& getRows() const { return _rows; }

        RawTable selectRows(std::span<const std::size_t> rowIds) const;

    private:
        std::vector<std::string> _columnNames;
        std::vector<Row> _rows;
    };

    // Default column names when there is no header: user, item, label, col3, col4, ...
    std::vector<std::string> getDefaultColumnNames(std::size_t columnCount);

    struct ReadParameters
    {
        char delimiter{ ',' };
        bool hasHeader{ true };
    };

    // throws dataset::Exception
    RawTable readTable(std::istream& is, const ReadParameters& params);
    RawTable readTable(const std::filesystem::path& path, const ReadParameters& params);
} // namespace rekit::dataset
