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

#include <vector>

#include "dataset/DatasetInfo.hpp"
#include "recommendation/IRecommender.hpp"

namespace rekit::recommendation
{
    class Recommender : public IRecommender
    {
    public:
        Recommender(const dataset::DatasetInfo& datasetInfo, const IScoreModel& model);
        ~Recommender() override = default;
        Recommender(const Recommender&) = delete;
        Recommender& operator=(const Recommender&) = delete;

    private:
        QueryResolution resolve(std::string_view user, std::string_view item) const override;
        double predict(std::string_view user, std::string_view item, ColdStartPolicy policy) const override;
        std::vector<double> predict(std::span<const PredictionQuery> queries, ColdStartPolicy policy) const override;
        std::vector<double> predictRecords(const dataset::RecordSet& records, std::size_t offset, std::size_t count, ColdStartPolicy policy) const override;
        std::vector<Recommendation> recommendUser(std::string_view user, std::size_t maxCount, ColdStartPolicy policy, bool filterConsumed) const override;
        std::vector<Recommendation> recommendKnownUser(dataset::Index user, std::size_t maxCount, bool filterConsumed) const override;
        const dataset::DatasetInfo& getDatasetInfo() const override { return _datasetInfo; }

        double predictKnown(dataset::Index user, dataset::Index item) const;
        double predictCold(dataset::EntityType unknownType, std::string_view unknownId, ColdStartPolicy policy) const;
        std::vector<Recommendation> selectTopItems(const std::vector<double>& scores, std::size_t maxCount, std::span<const dataset::Index> excludedItems) const;
        std::vector<Recommendation> recommendPopularItems(std::size_t maxCount) const;

        const dataset::DatasetInfo& _datasetInfo;
        const IScoreModel& _model;
        const dataset::Task _task;
        const std::size_t _itemCount;
        const double _globalMean;
        const double _minLabel;
        const double _maxLabel;
        const std::vector<Recommendation> _popularItems;
    };
} // namespace rekit::recommendation
