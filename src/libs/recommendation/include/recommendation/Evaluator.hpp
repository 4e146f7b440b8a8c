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

#include <map>
#include <span>
#include <string_view>

#include "dataset/RecordSet.hpp"
#include "dataset/Types.hpp"
#include "recommendation/Types.hpp"

namespace rekit::recommendation
{
    class IRecommender;

    enum class Metric
    {
        // rating
        RMSE,
        MAE,
        R2,
        // ranking, pointwise
        LogLoss,
        RocAuc,
        PrAuc,
        // ranking, top-k per user
        Precision,
        Recall,
        MAP,
        NDCG,
    };
    const char* getMetricName(Metric metric);
    // throws IncompatibleMetricException if the name is unknown
    Metric parseMetric(std::string_view str);
    bool isMetricCompatible(Metric metric, dataset::Task task);

    struct EvaluationParameters
    {
        std::size_t k{ 10 };
        std::size_t batchSize{ 8192 };
        ColdStartPolicy coldStart{ ColdStartPolicy::Average };
        bool filterConsumed{ true };
    };

    // throws IncompatibleMetricException if a metric does not match the task of the recommender
    std::map<Metric, double> evaluate(const IRecommender& recommender, const dataset::RecordSet& records, std::span<const Metric> metrics, const EvaluationParameters& params);
} // namespace rekit::recommendation
