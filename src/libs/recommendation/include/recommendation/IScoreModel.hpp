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

#include <string_view>
#include <vector>

#include "dataset/RecordSet.hpp"
#include "dataset/Types.hpp"

namespace rekit::recommendation
{
    // Scoring backend, works in the index space of the DatasetInfo it was created with
    class IScoreModel
    {
    public:
        virtual ~IScoreModel() = default;

        virtual std::string_view getName() const = 0;

        // Unresolved records are ignored
        virtual void fit(const dataset::RecordSet& trainSet) = 0;

        // Indices must be registered
        virtual double predict(dataset::Index user, dataset::Index item) const = 0;
        // One score per registered item
        virtual std::vector<double> scoreAllItems(dataset::Index user) const = 0;
        // Scores of an average user, used for cold start
        virtual std::vector<double> scoreAllItemsForUnknownUser() const = 0;
    };
} // namespace rekit::recommendation
