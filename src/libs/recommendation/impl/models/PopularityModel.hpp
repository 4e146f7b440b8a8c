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
#include "recommendation/IScoreModel.hpp"

namespace rekit::recommendation
{
    class PopularityModel : public IScoreModel
    {
    public:
        PopularityModel(const dataset::DatasetInfo& datasetInfo)
            : _datasetInfo{ datasetInfo } {}

        ~PopularityModel() override = default;
        PopularityModel(const PopularityModel&) = delete;
        PopularityModel& operator=(const PopularityModel&) = delete;

    private:
        std::string_view getName() const override { return "popular"; }
        void fit(const dataset::RecordSet& trainSet) override;
        double predict(dataset::Index user, dataset::Index item) const override;
        std::vector<double> scoreAllItems(dataset::Index user) const override;
        std::vector<double> scoreAllItemsForUnknownUser() const override;

        double getItemScore(dataset::Index item) const;

        const dataset::DatasetInfo& _datasetInfo;
        std::vector<double> _itemScores;
        double _defaultScore{};
    };
} // namespace rekit::recommendation
