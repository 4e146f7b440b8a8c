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

#include "Recommender.hpp"

#include <algorithm>
#include <cmath>
#include <optional>
#include <string>

#include "core/ILogger.hpp"
#include "dataset/Exception.hpp"

namespace rekit::recommendation
{
    namespace
    {
        std::vector<Recommendation> createPopularItems(const dataset::DatasetInfo& datasetInfo)
        {
            std::vector<Recommendation> res;
            res.reserve(datasetInfo.getPopularItems().size());

            for (dataset::Index item : datasetInfo.getPopularItems())
            {
                res.push_back(Recommendation{
                    datasetInfo.getRegistry().lookupRaw(dataset::EntityType::Item, item),
                    item,
                    static_cast<double>(datasetInfo.getItemPopularity(item)),
                });
            }

            return res;
        }
    } // namespace

    std::unique_ptr<IRecommender> createRecommender(const dataset::DatasetInfo& datasetInfo, const IScoreModel& model)
    {
        return std::make_unique<Recommender>(datasetInfo, model);
    }

    Recommender::Recommender(const dataset::DatasetInfo& datasetInfo, const IScoreModel& model)
        : _datasetInfo{ datasetInfo }
        , _model{ model }
        , _task{ datasetInfo.getTask() }
        , _itemCount{ datasetInfo.getItemCount() }
        , _globalMean{ datasetInfo.getGlobalMean() }
        , _minLabel{ datasetInfo.getMinLabel() }
        , _maxLabel{ datasetInfo.getMaxLabel() }
        , _popularItems{ createPopularItems(datasetInfo) }
    {
        REKIT_LOG(RECOMMENDATION, DEBUG, "Recommender created using model '" << _model.getName() << "', " << _itemCount << " items, global mean = " << _globalMean);
    }

    QueryResolution Recommender::resolve(std::string_view user, std::string_view item) const
    {
        const bool userKnown{ _datasetInfo.getRegistry().contains(dataset::EntityType::User, user) };
        const bool itemKnown{ _datasetInfo.getRegistry().contains(dataset::EntityType::Item, item) };

        if (userKnown && itemKnown)
            return QueryResolution::Resolved;
        if (itemKnown)
            return QueryResolution::ColdUser;
        if (userKnown)
            return QueryResolution::ColdItem;

        return QueryResolution::ColdBoth;
    }

    double Recommender::predict(std::string_view user, std::string_view item, ColdStartPolicy policy) const
    {
        const dataset::IdentifierRegistry& registry{ _datasetInfo.getRegistry() };

        const std::optional<dataset::Index> userIndex{ registry.findIndex(dataset::EntityType::User, user) };
        if (!userIndex)
            return predictCold(dataset::EntityType::User, user, policy);

        const std::optional<dataset::Index> itemIndex{ registry.findIndex(dataset::EntityType::Item, item) };
        if (!itemIndex)
            return predictCold(dataset::EntityType::Item, item, policy);

        return predictKnown(*userIndex, *itemIndex);
    }

    std::vector<double> Recommender::predict(std::span<const PredictionQuery> queries, ColdStartPolicy policy) const
    {
        std::vector<double> res;
        res.reserve(queries.size());

        for (const PredictionQuery& query : queries)
            res.push_back(predict(query.user, query.item, policy));

        return res;
    }

    std::vector<double> Recommender::predictRecords(const dataset::RecordSet& records, std::size_t offset, std::size_t count, ColdStartPolicy policy) const
    {
        if (offset > records.size() || count > records.size() - offset)
            throw Exception{ "Record range out of bounds" };

        std::vector<double> res;
        res.reserve(count);

        for (std::size_t row{ offset }; row < offset + count; ++row)
        {
            if (records.isResolved(row))
                res.push_back(predictKnown(records.getUserIndices()[row], records.getItemIndices()[row]));
            else if (!records.isUserResolved(row))
                res.push_back(predictCold(dataset::EntityType::User, records.getUnresolvedUser(row).value_or(""), policy));
            else
                res.push_back(predictCold(dataset::EntityType::Item, records.getUnresolvedItem(row).value_or(""), policy));
        }

        return res;
    }

    std::vector<Recommendation> Recommender::recommendUser(std::string_view user, std::size_t maxCount, ColdStartPolicy policy, bool filterConsumed) const
    {
        if (const std::optional<dataset::Index> userIndex{ _datasetInfo.getRegistry().findIndex(dataset::EntityType::User, user) })
            return recommendKnownUser(*userIndex, maxCount, filterConsumed);

        REKIT_LOG(RECOMMENDATION, DEBUG, "Unknown user '" << user << "', using cold start policy '" << getColdStartPolicyName(policy) << "'");

        switch (policy)
        {
        case ColdStartPolicy::Average:
            return selectTopItems(_model.scoreAllItemsForUnknownUser(), maxCount, {});

        case ColdStartPolicy::Popular:
            return recommendPopularItems(maxCount);

        case ColdStartPolicy::Fail:
            break;
        }

        throw dataset::UnknownEntityException{ dataset::EntityType::User, user };
    }

    std::vector<Recommendation> Recommender::recommendKnownUser(dataset::Index user, std::size_t maxCount, bool filterConsumed) const
    {
        if (user >= _datasetInfo.getUserCount())
            throw dataset::UnknownEntityException{ dataset::EntityType::User, user };

        std::span<const dataset::Index> excludedItems;
        if (filterConsumed)
            excludedItems = _datasetInfo.getConsumedItems(user);

        return selectTopItems(_model.scoreAllItems(user), maxCount, excludedItems);
    }

    double Recommender::predictKnown(dataset::Index user, dataset::Index item) const
    {
        const double score{ _model.predict(user, item) };
        if (_task == dataset::Task::Rating)
            return std::clamp(score, _minLabel, _maxLabel);

        return score;
    }

    double Recommender::predictCold(dataset::EntityType unknownType, std::string_view unknownId, ColdStartPolicy policy) const
    {
        switch (policy)
        {
        case ColdStartPolicy::Average:
        case ColdStartPolicy::Popular:
            return _globalMean;

        case ColdStartPolicy::Fail:
            break;
        }

        throw dataset::UnknownEntityException{ unknownType, unknownId };
    }

    std::vector<Recommendation> Recommender::selectTopItems(const std::vector<double>& scores, std::size_t maxCount, std::span<const dataset::Index> excludedItems) const
    {
        if (scores.size() != _itemCount)
            throw Exception{ "Model '" + std::string{ _model.getName() } + "' returned " + std::to_string(scores.size()) + " scores, expected " + std::to_string(_itemCount) };

        const auto itNonFinite{ std::find_if(std::cbegin(scores), std::cend(scores), [](double score) { return !std::isfinite(score); }) };
        if (itNonFinite != std::cend(scores))
            throw Exception{ "Model '" + std::string{ _model.getName() } + "' returned a non finite score for item " + std::to_string(std::distance(std::cbegin(scores), itNonFinite)) };

        std::vector<dataset::Index> candidates;
        candidates.reserve(_itemCount);
        for (dataset::Index item{}; item < _itemCount; ++item)
        {
            if (!std::binary_search(std::cbegin(excludedItems), std::cend(excludedItems), item))
                candidates.push_back(item);
        }

        const auto getScore{ [&](dataset::Index item) {
            return _task == dataset::Task::Rating ? std::clamp(scores[item], _minLabel, _maxLabel) : scores[item];
        } };

        const std::size_t count{ std::min(maxCount, candidates.size()) };
        std::partial_sort(std::begin(candidates), std::next(std::begin(candidates), count), std::end(candidates), [&](dataset::Index lhs, dataset::Index rhs) {
            const double lhsScore{ getScore(lhs) };
            const double rhsScore{ getScore(rhs) };
            if (lhsScore != rhsScore)
                return lhsScore > rhsScore;
            return lhs < rhs;
        });

        std::vector<Recommendation> res;
        res.reserve(count);
        for (std::size_t i{}; i < count; ++i)
        {
            const dataset::Index item{ candidates[i] };
            res.push_back(Recommendation{ _datasetInfo.getRegistry().lookupRaw(dataset::EntityType::Item, item), item, getScore(item) });
        }

        return res;
    }

    std::vector<Recommendation> Recommender::recommendPopularItems(std::size_t maxCount) const
    {
        const std::size_t count{ std::min(maxCount, _popularItems.size()) };
        return std::vector<Recommendation>(std::cbegin(_popularItems), std::next(std::cbegin(_popularItems), count));
    }
} // namespace rekit::recommendation
