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

#include <iosfwd>
#include <span>
#include <vector>

#include "dataset/FeatureEncoder.hpp"
#include "dataset/IdentifierRegistry.hpp"
#include "dataset/Schema.hpp"
#include "dataset/Types.hpp"

namespace rekit::dataset
{
    class TableBuilder;

    // Identifier mappings, feature layout and corpus statistics shared between the
    // data preparation and the serving sides. Only mutated by its TableBuilder
    class DatasetInfo
    {
    public:
        DatasetInfo(const Schema& schema, Task task);
        ~DatasetInfo() = default;
        DatasetInfo(const DatasetInfo&) = delete;
        DatasetInfo& operator=(const DatasetInfo&) = delete;

        Task getTask() const { return _task; }
        const Schema& getSchema() const { return _schema; }
        const IdentifierRegistry& getRegistry() const { return _registry; }
        const FeatureEncoder& getFeatureEncoder() const { return _featureEncoder; }

        std::size_t getUserCount() const { return _registry.getCount(EntityType::User); }
        std::size_t getItemCount() const { return _registry.getCount(EntityType::Item); }
        // Ranking tasks only count the positive rows
        std::size_t getInteractionCount() const { return _interactionCount; }
        // 1 - interactions / (users * items)
        double getSparsity() const;

        // Over all the training rows, negative ones included
        double getGlobalMean() const;
        double getMinLabel() const { return _minLabel; }
        double getMaxLabel() const { return _maxLabel; }

        std::size_t getItemPopularity(Index item) const { return _itemPopularity.at(item); }
        // Items sorted by decreasing interaction count, ties by increasing index
        std::span<const Index> getPopularItems() const { return _popularItems; }

        // Sorted items a user has positively interacted with in the training sets
        std::span<const Index> getConsumedItems(Index user) const;
        bool hasConsumed(Index user, Index item) const;

        // Last known features of a user or an item, nullptr if no features are declared
        const EncodedFeatures* getUserFeatures(Index user) const;
        const EncodedFeatures* getItemFeatures(Index item) const;

        void dump(std::ostream& os) const;

    private:
        friend class TableBuilder;

        IdentifierRegistry& getRegistry() { return _registry; }
        FeatureEncoder& getFeatureEncoder() { return _featureEncoder; }

        void addInteraction(Index user, Index item, double label, const EncodedFeatures& features);
        void refreshStatistics();

        const Schema _schema;
        const Task _task;
        IdentifierRegistry _registry;
        FeatureEncoder _featureEncoder;

        std::size_t _interactionCount{};
        std::size_t _labelCount{};
        double _labelSum{};
        double _minLabel{};
        double _maxLabel{};
        std::vector<std::size_t> _itemPopularity;
        std::vector<Index> _popularItems;
        std::vector<std::vector<Index>> _consumedItems;
        std::vector<EncodedFeatures> _userFeatures;
        std::vector<EncodedFeatures> _itemFeatures;
    };

    std::ostream& operator<<(std::ostream& os, const DatasetInfo& datasetInfo);
} // namespace rekit::dataset
