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

#include "dataset/DatasetInfo.hpp"

#include <algorithm>
#include <iomanip>
#include <numeric>
#include <ostream>
#include <sstream>

#include "dataset/Exception.hpp"

namespace rekit::dataset
{
    DatasetInfo::DatasetInfo(const Schema& schema, Task task)
        : _schema{ schema }
        , _task{ task }
        , _featureEncoder{ _schema }
    {
    }

    double DatasetInfo::getSparsity() const
    {
        const double cellCount{ static_cast<double>(getUserCount()) * static_cast<double>(getItemCount()) };
        if (cellCount == 0)
            return 1;

        return 1. - static_cast<double>(_interactionCount) / cellCount;
    }

    double DatasetInfo::getGlobalMean() const
    {
        if (_labelCount == 0)
            return 0;

        return _labelSum / static_cast<double>(_labelCount);
    }

    std::span<const Index> DatasetInfo::getConsumedItems(Index user) const
    {
        if (user >= _consumedItems.size())
            throw UnknownEntityException{ EntityType::User, user };

        return _consumedItems[user];
    }

    bool DatasetInfo::hasConsumed(Index user, Index item) const
    {
        const std::span<const Index> items{ getConsumedItems(user) };
        return std::binary_search(std::cbegin(items), std::cend(items), item);
    }

    const EncodedFeatures* DatasetInfo::getUserFeatures(Index user) const
    {
        if (user >= _userFeatures.size())
            return nullptr;

        return &_userFeatures[user];
    }

    const EncodedFeatures* DatasetInfo::getItemFeatures(Index item) const
    {
        if (item >= _itemFeatures.size())
            return nullptr;

        return &_itemFeatures[item];
    }

    void DatasetInfo::addInteraction(Index user, Index item, double label, const EncodedFeatures& features)
    {
        if (_labelCount == 0)
        {
            _minLabel = label;
            _maxLabel = label;
        }
        else
        {
            _minLabel = std::min(_minLabel, label);
            _maxLabel = std::max(_maxLabel, label);
        }

        ++_labelCount;
        _labelSum += label;

        if (item >= _itemPopularity.size())
            _itemPopularity.resize(item + 1);
        if (user >= _consumedItems.size())
            _consumedItems.resize(user + 1);

        // ranking: negative rows are not interactions
        if (_task == Task::Rating || label > 0)
        {
            ++_interactionCount;
            _itemPopularity[item] += 1;

            std::vector<Index>& consumedItems{ _consumedItems[user] };
            auto itConsumed{ std::lower_bound(std::begin(consumedItems), std::end(consumedItems), item) };
            if (itConsumed == std::end(consumedItems) || *itConsumed != item)
                consumedItems.insert(itConsumed, item);
        }

        if (_schema.hasFeatures())
        {
            if (user >= _userFeatures.size())
                _userFeatures.resize(user + 1);
            _userFeatures[user] = features;

            if (item >= _itemFeatures.size())
                _itemFeatures.resize(item + 1);
            _itemFeatures[item] = features;
        }
    }

    void DatasetInfo::refreshStatistics()
    {
        _itemPopularity.resize(getItemCount());
        _consumedItems.resize(getUserCount());

        _popularItems.resize(getItemCount());
        std::iota(std::begin(_popularItems), std::end(_popularItems), Index{ 0 });
        std::stable_sort(std::begin(_popularItems), std::end(_popularItems), [this](Index lhs, Index rhs) {
            return _itemPopularity[lhs] > _itemPopularity[rhs];
        });
    }

    void DatasetInfo::dump(std::ostream& os) const
    {
        std::ostringstream sparsity;
        sparsity << std::fixed << std::setprecision(4) << getSparsity() * 100;

        os << "n_users: " << getUserCount() << ", n_items: " << getItemCount() << ", data sparsity: " << sparsity.str() << " %";

        for (const std::vector<FieldDescriptor>* fields : { &_featureEncoder.getSparseFields(), &_featureEncoder.getMultiSparseFields() })
        {
            for (const FieldDescriptor& field : *fields)
            {
                os << "\n  " << getFieldKindName(field.getKind()) << " '" << field.getName() << "': " << field.getCardinality() << " values";
                for (const FieldDescriptor::IndexRange& range : field.getIndexRanges())
                    os << ", [" << range.localBegin << "] -> " << range.globalOffset;
            }
        }
        for (const FieldDescriptor& field : _featureEncoder.getDenseFields())
            os << "\n  " << getFieldKindName(field.getKind()) << " '" << field.getName() << "'";
    }

    std::ostream& operator<<(std::ostream& os, const DatasetInfo& datasetInfo)
    {
        datasetInfo.dump(os);
        return os;
    }
} // namespace rekit::dataset
