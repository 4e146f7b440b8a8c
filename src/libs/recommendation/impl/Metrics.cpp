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

#include "recommendation/Metrics.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <numeric>
#include <vector>

#include "recommendation/Types.hpp"

namespace rekit::recommendation::metrics
{
    namespace
    {
        constexpr double nan{ std::numeric_limits<double>::quiet_NaN() };
        constexpr double epsilon{ 1e-7 };

        void checkSizes(std::span<const double> labels, std::span<const double> predictions)
        {
            if (labels.size() != predictions.size())
                throw Exception{ "Label and prediction counts differ: " + std::to_string(labels.size()) + " vs " + std::to_string(predictions.size()) };
        }

        // Positions sorted by decreasing prediction
        std::vector<std::size_t> sortByPrediction(std::span<const double> predictions)
        {
            std::vector<std::size_t> positions(predictions.size());
            std::iota(std::begin(positions), std::end(positions), std::size_t{ 0 });
            std::stable_sort(std::begin(positions), std::end(positions), [&](std::size_t lhs, std::size_t rhs) { return predictions[lhs] > predictions[rhs]; });

            return positions;
        }

        std::size_t countHits(std::span<const dataset::Index> recommendedItems, const std::unordered_set<dataset::Index>& relevantItems, std::size_t k)
        {
            const std::size_t count{ std::min(k, recommendedItems.size()) };
            return std::count_if(std::cbegin(recommendedItems), std::next(std::cbegin(recommendedItems), count), [&](dataset::Index item) { return relevantItems.contains(item); });
        }
    } // namespace

    double computeRmse(std::span<const double> labels, std::span<const double> predictions)
    {
        checkSizes(labels, predictions);
        if (labels.empty())
            return nan;

        double sum{};
        for (std::size_t i{}; i < labels.size(); ++i)
            sum += (labels[i] - predictions[i]) * (labels[i] - predictions[i]);

        return std::sqrt(sum / static_cast<double>(labels.size()));
    }

    double computeMae(std::span<const double> labels, std::span<const double> predictions)
    {
        checkSizes(labels, predictions);
        if (labels.empty())
            return nan;

        double sum{};
        for (std::size_t i{}; i < labels.size(); ++i)
            sum += std::abs(labels[i] - predictions[i]);

        return sum / static_cast<double>(labels.size());
    }

    double computeR2(std::span<const double> labels, std::span<const double> predictions)
    {
        checkSizes(labels, predictions);
        if (labels.empty())
            return nan;

        const double mean{ std::accumulate(std::cbegin(labels), std::cend(labels), 0.) / static_cast<double>(labels.size()) };

        double residualSum{};
        double totalSum{};
        for (std::size_t i{}; i < labels.size(); ++i)
        {
            residualSum += (labels[i] - predictions[i]) * (labels[i] - predictions[i]);
            totalSum += (labels[i] - mean) * (labels[i] - mean);
        }

        if (totalSum == 0)
            return nan;

        return 1 - residualSum / totalSum;
    }

    double computeLogLoss(std::span<const double> labels, std::span<const double> predictions)
    {
        checkSizes(labels, predictions);
        if (labels.empty())
            return nan;

        double sum{};
        for (std::size_t i{}; i < labels.size(); ++i)
        {
            const double prediction{ std::clamp(predictions[i], epsilon, 1 - epsilon) };
            sum -= labels[i] > 0 ? std::log(prediction) : std::log(1 - prediction);
        }

        return sum / static_cast<double>(labels.size());
    }

    double computeRocAuc(std::span<const double> labels, std::span<const double> predictions)
    {
        checkSizes(labels, predictions);

        // Mann-Whitney U statistic, tied predictions share their average rank
        std::vector<std::size_t> positions(predictions.size());
        std::iota(std::begin(positions), std::end(positions), std::size_t{ 0 });
        std::sort(std::begin(positions), std::end(positions), [&](std::size_t lhs, std::size_t rhs) { return predictions[lhs] < predictions[rhs]; });

        double positiveRankSum{};
        std::size_t positiveCount{};
        for (std::size_t begin{}; begin < positions.size();)
        {
            std::size_t end{ begin };
            while (end < positions.size() && predictions[positions[end]] == predictions[positions[begin]])
                ++end;

            const double averageRank{ (static_cast<double>(begin + 1) + static_cast<double>(end)) / 2 };
            for (std::size_t i{ begin }; i < end; ++i)
            {
                if (labels[positions[i]] > 0)
                {
                    positiveRankSum += averageRank;
                    positiveCount += 1;
                }
            }

            begin = end;
        }

        const std::size_t negativeCount{ labels.size() - positiveCount };
        if (positiveCount == 0 || negativeCount == 0)
            return nan;

        const double positives{ static_cast<double>(positiveCount) };
        return (positiveRankSum - positives * (positives + 1) / 2) / (positives * static_cast<double>(negativeCount));
    }

    double computePrAuc(std::span<const double> labels, std::span<const double> predictions)
    {
        checkSizes(labels, predictions);

        double precisionSum{};
        std::size_t positiveCount{};
        std::size_t rank{};
        for (std::size_t position : sortByPrediction(predictions))
        {
            ++rank;
            if (labels[position] > 0)
            {
                positiveCount += 1;
                precisionSum += static_cast<double>(positiveCount) / static_cast<double>(rank);
            }
        }

        if (positiveCount == 0)
            return nan;

        return precisionSum / static_cast<double>(positiveCount);
    }

    double computePrecisionAtK(std::span<const dataset::Index> recommendedItems, const std::unordered_set<dataset::Index>& relevantItems, std::size_t k)
    {
        if (k == 0)
            return nan;

        return static_cast<double>(countHits(recommendedItems, relevantItems, k)) / static_cast<double>(k);
    }

    double computeRecallAtK(std::span<const dataset::Index> recommendedItems, const std::unordered_set<dataset::Index>& relevantItems, std::size_t k)
    {
        if (relevantItems.empty())
            return nan;

        return static_cast<double>(countHits(recommendedItems, relevantItems, k)) / static_cast<double>(relevantItems.size());
    }

    double computeAveragePrecisionAtK(std::span<const dataset::Index> recommendedItems, const std::unordered_set<dataset::Index>& relevantItems, std::size_t k)
    {
        if (relevantItems.empty() || k == 0)
            return nan;

        double precisionSum{};
        std::size_t hitCount{};
        const std::size_t count{ std::min(k, recommendedItems.size()) };
        for (std::size_t i{}; i < count; ++i)
        {
            if (relevantItems.contains(recommendedItems[i]))
            {
                hitCount += 1;
                precisionSum += static_cast<double>(hitCount) / static_cast<double>(i + 1);
            }
        }

        return precisionSum / static_cast<double>(std::min(relevantItems.size(), k));
    }

    double computeNdcgAtK(std::span<const dataset::Index> recommendedItems, const std::unordered_set<dataset::Index>& relevantItems, std::size_t k)
    {
        if (relevantItems.empty() || k == 0)
            return nan;

        double dcg{};
        const std::size_t count{ std::min(k, recommendedItems.size()) };
        for (std::size_t i{}; i < count; ++i)
        {
            if (relevantItems.contains(recommendedItems[i]))
                dcg += 1 / std::log2(static_cast<double>(i + 2));
        }

        double idcg{};
        for (std::size_t i{}; i < std::min(k, relevantItems.size()); ++i)
            idcg += 1 / std::log2(static_cast<double>(i + 2));

        return dcg / idcg;
    }
} // namespace rekit::recommendation::metrics
