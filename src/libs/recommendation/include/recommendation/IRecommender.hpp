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

#include <memory>
#include <span>
#include <string_view>
#include <vector>

#include "dataset/RecordSet.hpp"
#include "recommendation/IScoreModel.hpp"
#include "recommendation/Types.hpp"

namespace rekit::dataset
{
    class DatasetInfo;
}

namespace rekit::recommendation
{
    // Serves predictions and Top-N recommendations on raw identifiers.
    // All the methods are const and can be called concurrently
    class IRecommender
    {
    public:
        virtual ~IRecommender() = default;

        virtual QueryResolution resolve(std::string_view user, std::string_view item) const = 0;

        // Cold start: Average and Popular return the global mean, Fail throws dataset::UnknownEntityException
        virtual double predict(std::string_view user, std::string_view item, ColdStartPolicy policy) const = 0;
        virtual std::vector<double> predict(std::span<const PredictionQuery> queries, ColdStartPolicy policy) const = 0;
        // Predictions for count records starting at offset, unresolved records use the cold start policy
        virtual std::vector<double> predictRecords(const dataset::RecordSet& records, std::size_t offset, std::size_t count, ColdStartPolicy policy) const = 0;

        // Sorted by decreasing score, ties by increasing item index
        virtual std::vector<Recommendation> recommendUser(std::string_view user, std::size_t maxCount, ColdStartPolicy policy, bool filterConsumed = true) const = 0;
        virtual std::vector<Recommendation> recommendKnownUser(dataset::Index user, std::size_t maxCount, bool filterConsumed = true) const = 0;

        virtual const dataset::DatasetInfo& getDatasetInfo() const = 0;
    };

    // Statistics used for cold start are copied at creation: the recommender must be
    // created again after a new training build
    std::unique_ptr<IRecommender> createRecommender(const dataset::DatasetInfo& datasetInfo, const IScoreModel& model);
} // namespace rekit::recommendation
