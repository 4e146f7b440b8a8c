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

#include <string>
#include <string_view>

#include "core/Exception.hpp"
#include "dataset/Types.hpp"

namespace rekit::recommendation
{
    class Exception : public core::RekitException
    {
    public:
        using RekitException::RekitException;
    };

    // Unrecognized cold start policy
    class InvalidPolicyException : public Exception
    {
    public:
        InvalidPolicyException(std::string_view policy)
            : Exception{ "Invalid cold start policy '" + std::string{ policy } + "', expected 'average', 'popular' or 'fail'" }
        {
        }
    };

    // Metric requested for the wrong task type, or unknown metric
    class IncompatibleMetricException : public Exception
    {
    public:
        IncompatibleMetricException(std::string_view metric, dataset::Task task)
            : Exception{ "Metric '" + std::string{ metric } + "' is not available for " + dataset::getTaskName(task) + " tasks" }
        {
        }

        IncompatibleMetricException(std::string_view metric)
            : Exception{ "Unknown metric '" + std::string{ metric } + "'" }
        {
        }
    };

    enum class ColdStartPolicy
    {
        Average, // global mean for predictions, average user scores for recommendations
        Popular, // most popular items for recommendations, global mean for predictions
        Fail,    // UnknownEntityException is thrown
    };
    const char* getColdStartPolicyName(ColdStartPolicy policy);
    // throws InvalidPolicyException
    ColdStartPolicy parseColdStartPolicy(std::string_view str);

    enum class QueryResolution
    {
        Resolved,
        ColdUser,
        ColdItem,
        ColdBoth,
    };
    const char* getQueryResolutionName(QueryResolution resolution);

    struct PredictionQuery
    {
        std::string_view user;
        std::string_view item;
    };

    struct Recommendation
    {
        dataset::RawId itemId;
        dataset::Index itemIndex;
        double score;
    };
} // namespace rekit::recommendation
