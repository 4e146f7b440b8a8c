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

#include "UserCFModel.hpp"

#include <algorithm>
#include <cmath>
#include <map>

#include "core/ILogger.hpp"
#include "recommendation/Types.hpp"

namespace rekit::recommendation
{
    std::unique_ptr<IScoreModel> createUserCFModel(const dataset::DatasetInfo& datasetInfo, const UserCFParameters& params)
    {
        return std::make_unique<UserCFModel>(datasetInfo, params);
    }

    UserCFModel::UserCFModel(const dataset::DatasetInfo& datasetInfo, const UserCFParameters& params)
        : _datasetInfo{ datasetInfo }
        , _params{ params }
    {
        if (_params.neighborCount == 0)
            throw Exception{ "Neighbor count must be positive" };
    }

    void UserCFModel::fit(const dataset::RecordSet& trainSet)
    {
        const bool ranking{ _datasetInfo.getTask() == dataset::Task::Ranking };
        const std::size_t userCount{ _datasetInfo.getUserCount() };
        const std::size_t itemCount{ _datasetInfo.getItemCount() };

        // last label wins for duplicated pairs
        std::vector<std::map<dataset::Index, double>> userLabels(userCount);
        for (std::size_t row{}; row < trainSet.size(); ++row)
        {
            if (!trainSet.isResolved(row))
                continue;

            const double label{ trainSet.getLabels()[row] };
            const dataset::Index user{ trainSet.getUserIndices()[row] };
            const dataset::Index item{ trainSet.getItemIndices()[row] };
            if (ranking && label <= 0)
            {
                userLabels[user].erase(item);
                continue;
            }

            userLabels[user][item] = label;
        }

        _userItems.assign(userCount, {});
        _itemUsers.assign(itemCount, {});
        _userNorms.assign(userCount, 0);

        std::vector<double> itemSums(itemCount);
        double labelSum{};
        std::size_t labelCount{};
        for (dataset::Index user{}; user < userCount; ++user)
        {
            double squaredNorm{};
            for (const auto& [item, label] : userLabels[user])
            {
                _userItems[user].push_back(Entry{ item, label });
                _itemUsers[item].push_back(Entry{ user, label });
                squaredNorm += label * label;
                itemSums[item] += label;
                labelSum += label;
                labelCount += 1;
            }
            _userNorms[user] = std::sqrt(squaredNorm);
        }

        _globalMean = labelCount > 0 ? labelSum / static_cast<double>(labelCount) : 0;

        _averageUserScores.assign(itemCount, 0);
        for (dataset::Index item{}; item < itemCount; ++item)
        {
            const std::size_t count{ _itemUsers[item].size() };
            if (ranking)
                _averageUserScores[item] = userCount > 0 ? static_cast<double>(count) / static_cast<double>(userCount) : 0;
            else
                _averageUserScores[item] = count > 0 ? itemSums[item] / static_cast<double>(count) : _globalMean;
        }

        REKIT_LOG(MODEL, DEBUG, "UserCF model fitted on " << labelCount << " interactions, " << userCount << " users, " << itemCount << " items");
    }

    std::vector<UserCFModel::Neighbor> UserCFModel::findNeighbors(dataset::Index user) const
    {
        std::vector<Neighbor> neighbors;
        if (user >= _userItems.size() || _userNorms[user] == 0)
            return neighbors;

        std::vector<double> dotProducts(_userItems.size());
        std::vector<bool> visited(_userItems.size());
        std::vector<dataset::Index> candidates;
        for (const Entry& userItem : _userItems[user])
        {
            for (const Entry& itemUser : _itemUsers[userItem.index])
            {
                if (itemUser.index == user)
                    continue;

                if (!visited[itemUser.index])
                {
                    visited[itemUser.index] = true;
                    candidates.push_back(itemUser.index);
                }
                dotProducts[itemUser.index] += userItem.value * itemUser.value;
            }
        }

        for (dataset::Index candidate : candidates)
        {
            if (_userNorms[candidate] == 0)
                continue;

            const double similarity{ dotProducts[candidate] / (_userNorms[user] * _userNorms[candidate]) };
            if (similarity > 0)
                neighbors.push_back(Neighbor{ candidate, similarity });
        }

        const auto compare{ [](const Neighbor& lhs, const Neighbor& rhs) {
            if (lhs.similarity != rhs.similarity)
                return lhs.similarity > rhs.similarity;
            return lhs.user < rhs.user;
        } };

        const std::size_t count{ std::min(_params.neighborCount, neighbors.size()) };
        std::partial_sort(std::begin(neighbors), std::next(std::begin(neighbors), count), std::end(neighbors), compare);
        neighbors.resize(count);

        return neighbors;
    }

    double UserCFModel::getFallbackScore(dataset::Index item) const
    {
        if (_datasetInfo.getTask() == dataset::Task::Ranking)
            return 0;

        return item < _averageUserScores.size() ? _averageUserScores[item] : _globalMean;
    }

    double UserCFModel::predict(dataset::Index user, dataset::Index item) const
    {
        const std::vector<Neighbor> neighbors{ findNeighbors(user) };

        double weightedSum{};
        double similaritySum{};
        double totalSimilarity{};
        for (const Neighbor& neighbor : neighbors)
        {
            totalSimilarity += neighbor.similarity;

            const std::vector<Entry>& items{ _userItems[neighbor.user] };
            const auto it{ std::lower_bound(std::cbegin(items), std::cend(items), item, [](const Entry& entry, dataset::Index index) { return entry.index < index; }) };
            if (it == std::cend(items) || it->index != item)
                continue;

            weightedSum += neighbor.similarity * it->value;
            similaritySum += neighbor.similarity;
        }

        if (_datasetInfo.getTask() == dataset::Task::Ranking)
            return totalSimilarity > 0 ? similaritySum / totalSimilarity : 0;

        return similaritySum > 0 ? weightedSum / similaritySum : getFallbackScore(item);
    }

    std::vector<double> UserCFModel::scoreAllItems(dataset::Index user) const
    {
        const std::size_t itemCount{ _datasetInfo.getItemCount() };

        std::vector<double> weightedSums(itemCount);
        std::vector<double> similaritySums(itemCount);
        double totalSimilarity{};
        for (const Neighbor& neighbor : findNeighbors(user))
        {
            totalSimilarity += neighbor.similarity;
            for (const Entry& entry : _userItems[neighbor.user])
            {
                weightedSums[entry.index] += neighbor.similarity * entry.value;
                similaritySums[entry.index] += neighbor.similarity;
            }
        }

        std::vector<double> scores(itemCount);
        for (dataset::Index item{}; item < itemCount; ++item)
        {
            if (_datasetInfo.getTask() == dataset::Task::Ranking)
                scores[item] = totalSimilarity > 0 ? similaritySums[item] / totalSimilarity : 0;
            else
                scores[item] = similaritySums[item] > 0 ? weightedSums[item] / similaritySums[item] : getFallbackScore(item);
        }

        return scores;
    }

    std::vector<double> UserCFModel::scoreAllItemsForUnknownUser() const
    {
        std::vector<double> scores(_datasetInfo.getItemCount(), _datasetInfo.getTask() == dataset::Task::Ranking ? 0 : _globalMean);
        std::copy_n(std::cbegin(_averageUserScores), std::min(scores.size(), _averageUserScores.size()), std::begin(scores));

        return scores;
    }
} // namespace rekit::recommendation
