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

#include <span>
#include <vector>

#include "dataset/DatasetInfo.hpp"
#include "recommendation/IScoreModel.hpp"
#include "recommendation/Models.hpp"

namespace rekit::recommendation
{
    class UserCFModel : public IScoreModel
    {
    public:
        UserCFModel(const dataset::DatasetInfo& datasetInfo, const UserCFParameters& params);
        ~UserCFModel() override = default;
        UserCFModel(const UserCFModel&) = delete;
        UserCFModel& operator=(const UserCFModel&) = delete;

        struct Neighbor
        {
            dataset::Index user;
            double similarity;
        };
        // Most similar users, by decreasing similarity then increasing index
        std::vector<Neighbor> findNeighbors(dataset::Index user) const;

    private:
        std::string_view getName() const override { return "usercf"; }
        void fit(const dataset::RecordSet& trainSet) override;
        double predict(dataset::Index user, dataset::Index item) const override;
        std::vector<double> scoreAllItems(dataset::Index user) const override;
        std::vector<double> scoreAllItemsForUnknownUser() const override;

        double getFallbackScore(dataset::Index item) const;

        struct Entry
        {
            dataset::Index index;
            double value;
        };

        const dataset::DatasetInfo& _datasetInfo;
        const UserCFParameters _params;
        std::vector<std::vector<Entry>> _userItems; // sorted by item
        std::vector<std::vector<Entry>> _itemUsers; // sorted by user
        std::vector<double> _userNorms;
        std::vector<double> _averageUserScores;
        double _globalMean{};
    };
} // namespace rekit::recommendation
