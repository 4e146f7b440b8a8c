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

#include "recommendation/Evaluator.hpp"

#include <algorithm>
#include <cmath>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "core/ILogger.hpp"
#include "core/String.hpp"
#include "dataset/DatasetInfo.hpp"
#include "recommendation/IRecommender.hpp"
#include "recommendation/Metrics.hpp"

namespace rekit::recommendation
{
    namespace
    {
        constexpr Metric allMetrics[]{
            Metric::RMSE,
            Metric::MAE,
            Metric::R2,
            Metric::LogLoss,
            Metric::RocAuc,
            Metric::PrAuc,
            Metric::Precision,
            Metric::Recall,
            Metric::MAP,
            Metric::NDCG,
        };

        bool isTopKMetric(Metric metric)
        {
            return metric == Metric::Precision || metric == Metric::Recall || metric == Metric::MAP || metric == Metric::NDCG;
        }

        std::vector<double> computePredictions(const IRecommender& recommender, const dataset::RecordSet& records, const EvaluationParameters& params)
        {
            std::vector<double> predictions;
            predictions.reserve(records.size());

            const std::size_t batchSize{ std::max<std::size_t>(params.batchSize, 1) };
            for (std::size_t offset{}; offset < records.size(); offset += batchSize)
            {
                const std::vector<double> batch{ recommender.predictRecords(records, offset, std::min(batchSize, records.size() - offset), params.coldStart) };
                predictions.insert(std::end(predictions), std::cbegin(batch), std::cend(batch));
            }

            return predictions;
        }

        double computePointwiseMetric(Metric metric, std::span<const double> labels, std::span<const double> predictions)
        {
            switch (metric)
            {
            case Metric::RMSE:
                return metrics::computeRmse(labels, predictions);
            case Metric::MAE:
                return metrics::computeMae(labels, predictions);
            case Metric::R2:
                return metrics::computeR2(labels, predictions);
            case Metric::LogLoss:
                return metrics::computeLogLoss(labels, predictions);
            case Metric::RocAuc:
                return metrics::computeRocAuc(labels, predictions);
            case Metric::PrAuc:
                return metrics::computePrAuc(labels, predictions);
            case Metric::Precision:
            case Metric::Recall:
            case Metric::MAP:
            case Metric::NDCG:
                break;
            }

            throw Exception{ std::string{ "Metric '" } + getMetricName(metric) + "' is not pointwise" };
        }

        // Averaged over the resolved users having at least one positive record
        std::map<Metric, double> computeTopKMetrics(const IRecommender& recommender, const dataset::RecordSet& records, std::span<const Metric> topKMetrics, const EvaluationParameters& params)
        {
            std::unordered_map<dataset::Index, std::unordered_set<dataset::Index>> userPositives;
            for (std::size_t row{}; row < records.size(); ++row)
            {
                if (records.isResolved(row) && records.getLabels()[row] > 0)
                    userPositives[records.getUserIndices()[row]].insert(records.getItemIndices()[row]);
            }

            std::vector<dataset::Index> users;
            users.reserve(userPositives.size());
            for (const auto& [user, positives] : userPositives)
                users.push_back(user);
            std::sort(std::begin(users), std::end(users));

            std::map<Metric, double> sums;
            for (Metric metric : topKMetrics)
                sums[metric] = 0;

            for (dataset::Index user : users)
            {
                const std::unordered_set<dataset::Index>& positives{ userPositives[user] };

                std::vector<dataset::Index> recommendedItems;
                for (const Recommendation& recommendation : recommender.recommendKnownUser(user, params.k, params.filterConsumed))
                    recommendedItems.push_back(recommendation.itemIndex);

                for (Metric metric : topKMetrics)
                {
                    switch (metric)
                    {
                    case Metric::Precision:
                        sums[metric] += metrics::computePrecisionAtK(recommendedItems, positives, params.k);
                        break;
                    case Metric::Recall:
                        sums[metric] += metrics::computeRecallAtK(recommendedItems, positives, params.k);
                        break;
                    case Metric::MAP:
                        sums[metric] += metrics::computeAveragePrecisionAtK(recommendedItems, positives, params.k);
                        break;
                    case Metric::NDCG:
                        sums[metric] += metrics::computeNdcgAtK(recommendedItems, positives, params.k);
                        break;
                    default:
                        break;
                    }
                }
            }

            REKIT_LOG(EVALUATION, DEBUG, "Top-" << params.k << " metrics computed on " << users.size() << " users");

            std::map<Metric, double> res;
            for (const auto& [metric, sum] : sums)
                res[metric] = users.empty() ? std::nan("") : sum / static_cast<double>(users.size());

            return res;
        }
    } // namespace

    const char* getMetricName(Metric metric)
    {
        switch (metric)
        {
        case Metric::RMSE:
            return "rmse";
        case Metric::MAE:
            return "mae";
        case Metric::R2:
            return "r2";
        case Metric::LogLoss:
            return "loss";
        case Metric::RocAuc:
            return "roc_auc";
        case Metric::PrAuc:
            return "pr_auc";
        case Metric::Precision:
            return "precision";
        case Metric::Recall:
            return "recall";
        case Metric::MAP:
            return "map";
        case Metric::NDCG:
            return "ndcg";
        }

        return "";
    }

    Metric parseMetric(std::string_view str)
    {
        for (Metric metric : allMetrics)
        {
            if (core::stringUtils::stringCaseInsensitiveEqual(core::stringUtils::stringTrim(str), getMetricName(metric)))
                return metric;
        }

        throw IncompatibleMetricException{ str };
    }

    bool isMetricCompatible(Metric metric, dataset::Task task)
    {
        switch (metric)
        {
        case Metric::RMSE:
        case Metric::MAE:
        case Metric::R2:
            return task == dataset::Task::Rating;

        case Metric::LogLoss:
        case Metric::RocAuc:
        case Metric::PrAuc:
        case Metric::Precision:
        case Metric::Recall:
        case Metric::MAP:
        case Metric::NDCG:
            return task == dataset::Task::Ranking;
        }

        return false;
    }

    std::map<Metric, double> evaluate(const IRecommender& recommender, const dataset::RecordSet& records, std::span<const Metric> metrics, const EvaluationParameters& params)
    {
        const dataset::Task task{ recommender.getDatasetInfo().getTask() };

        std::vector<Metric> pointwiseMetrics;
        std::vector<Metric> topKMetrics;
        for (Metric metric : metrics)
        {
            if (!isMetricCompatible(metric, task))
                throw IncompatibleMetricException{ getMetricName(metric), task };

            if (isTopKMetric(metric))
                topKMetrics.push_back(metric);
            else
                pointwiseMetrics.push_back(metric);
        }

        if (!topKMetrics.empty() && params.k == 0)
            throw Exception{ "k must be positive" };

        std::map<Metric, double> res;

        if (!pointwiseMetrics.empty())
        {
            const std::vector<double> predictions{ computePredictions(recommender, records, params) };
            for (Metric metric : pointwiseMetrics)
                res[metric] = computePointwiseMetric(metric, records.getLabels(), predictions);
        }

        if (!topKMetrics.empty())
            res.merge(computeTopKMetrics(recommender, records, topKMetrics, params));

        for (const auto& [metric, value] : res)
        {
            REKIT_LOG(EVALUATION, INFO, getMetricName(metric) << ": " << value);
            REKIT_LOG_IF(EVALUATION, WARNING, std::isnan(value), "Metric '" << getMetricName(metric) << "' is undefined on this record set");
        }

        return res;
    }
} // namespace rekit::recommendation
