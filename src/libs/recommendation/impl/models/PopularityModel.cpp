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

#include "PopularityModel.hpp"

#include <algorithm>

#include "core/ILogger.hpp"
#include "recommendation/Models.hpp"

namespace rekit::recommendation
{
    std::unique_ptr<IScoreModel> createPopularityModel(const dataset::DatasetInfo& datasetInfo)
    {
        return std::make_unique<PopularityModel>(datasetInfo);
    }

    void PopularityModel::fit(const dataset::RecordSet& trainSet)
    {
        const std::size_t itemCount{ _datasetInfo.getItemCount() };

        std::vector<double> sums(itemCount);
        std::vector<std::size_t> counts(itemCount);
        double labelSum{};
        std::size_t labelCount{};

        for (std::size_t row{}; row < trainSet.size(); ++row)
        {
            if (!trainSet.isResolved(row))
                continue;

            const dataset::Index item{ trainSet.getItemIndices()[row] };
            const double label{ trainSet.getLabels()[row] };
            if (_datasetInfo.getTask() == dataset::Task::Ranking && label <= 0)
                continue;

            sums[item] += label;
            counts[item] += 1;
            labelSum += label;
            labelCount += 1;
        }

        _itemScores.assign(itemCount, 0);
        if (_datasetInfo.getTask() == dataset::Task::Rating)
        {
            _defaultScore = labelCount > 0 ? labelSum / static_cast<double>(labelCount) : 0;
            for (dataset::Index item{}; item < itemCount; ++item)
                _itemScores[item] = counts[item] > 0 ? sums[item] / static_cast<double>(counts[item]) : _defaultScore;
        }
        else
        {
            _defaultScore = 0;
            const std::size_t maxCount{ counts.empty() ? 0 : *std::max_element(std::cbegin(counts), std::cend(counts)) };
            if (maxCount > 0)
            {
                for (dataset::Index item{}; item < itemCount; ++item)
                    _itemScores[item] = static_cast<double>(counts[item]) / static_cast<double>(maxCount);
            }
        }

        REKIT_LOG(MODEL, DEBUG, "Popularity model fitted on " << labelCount << " interactions, " << itemCount << " items");
    }

    double PopularityModel::getItemScore(dataset::Index item) const
    {
        return item < _itemScores.size() ? _itemScores[item] : _defaultScore;
    }

    double PopularityModel::predict(dataset::Index /*user*/, dataset::Index item) const
    {
        return getItemScore(item);
    }

    std::vector<double> PopularityModel::scoreAllItems(dataset::Index /*user*/) const
    {
        return scoreAllItemsForUnknownUser();
    }

    std::vector<double> PopularityModel::scoreAllItemsForUnknownUser() const
    {
        std::vector<double> scores(_datasetInfo.getItemCount());
        for (dataset::Index item{}; item < scores.size(); ++item)
            scores[item] = getItemScore(item);

        return scores;
    }
} // namespace rekit::recommendation
