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

#include "dataset/RecordSet.hpp"

#include <algorithm>
#include <cassert>

#include "dataset/Exception.hpp"

namespace rekit::dataset
{
    void RecordColumns::append(Index user, Index item, double label, NegativeKind negativeKind, const EncodedFeatures& features)
    {
        assert(features.sparse.size() == sparseFieldCount);
        assert(features.multiSparse.size() == multiSparseWidth);
        assert(features.dense.size() == denseFieldCount);

        userIndices.push_back(user);
        itemIndices.push_back(item);
        labels.push_back(label);
        negativeKinds.push_back(negativeKind);
        sparseIndices.insert(std::end(sparseIndices), std::cbegin(features.sparse), std::cend(features.sparse));
        multiSparseIndices.insert(std::end(multiSparseIndices), std::cbegin(features.multiSparse), std::cend(features.multiSparse));
        denseValues.insert(std::end(denseValues), std::cbegin(features.dense), std::cend(features.dense));
    }

    RecordSet::RecordSet(RecordColumns&& columns)
        : _columns{ std::move(columns) }
    {
        const std::size_t rowCount{ _columns.size() };
        if (_columns.userIndices.size() != rowCount
            || _columns.itemIndices.size() != rowCount
            || _columns.negativeKinds.size() != rowCount
            || _columns.sparseIndices.size() != rowCount * _columns.sparseFieldCount
            || _columns.multiSparseIndices.size() != rowCount * _columns.multiSparseWidth
            || _columns.denseValues.size() != rowCount * _columns.denseFieldCount)
        {
            throw Exception{ "Inconsistent record columns" };
        }
    }

    RecordView RecordSet::getRecord(std::size_t row) const
    {
        return RecordView{
            _columns.userIndices[row],
            _columns.itemIndices[row],
            _columns.labels[row],
            _columns.negativeKinds[row],
            getSparseIndices().subspan(row * _columns.sparseFieldCount, _columns.sparseFieldCount),
            getMultiSparseIndices().subspan(row * _columns.multiSparseWidth, _columns.multiSparseWidth),
            getDenseValues().subspan(row * _columns.denseFieldCount, _columns.denseFieldCount),
        };
    }

    EncodedFeatures RecordSet::getFeatures(std::size_t row) const
    {
        const RecordView record{ getRecord(row) };

        return EncodedFeatures{
            { std::cbegin(record.sparseIndices), std::cend(record.sparseIndices) },
            { std::cbegin(record.multiSparseIndices), std::cend(record.multiSparseIndices) },
            { std::cbegin(record.denseValues), std::cend(record.denseValues) },
        };
    }

    std::optional<RawId> RecordSet::getUnresolvedUser(std::size_t row) const
    {
        const auto it{ _columns.unresolvedUsers.find(row) };
        if (it == std::cend(_columns.unresolvedUsers))
            return std::nullopt;

        return it->second;
    }

    std::optional<RawId> RecordSet::getUnresolvedItem(std::size_t row) const
    {
        const auto it{ _columns.unresolvedItems.find(row) };
        if (it == std::cend(_columns.unresolvedItems))
            return std::nullopt;

        return it->second;
    }

    std::size_t RecordSet::getUnresolvedCount() const
    {
        std::size_t count{};
        for (std::size_t row{}; row < size(); ++row)
        {
            if (!isResolved(row))
                ++count;
        }

        return count;
    }
} // namespace rekit::dataset
