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
#include <unordered_set>

#include "dataset/Types.hpp"

// Label / prediction metrics. Sizes must match, otherwise recommendation::Exception is thrown
namespace rekit::recommendation::metrics
{
    double computeRmse(std::span<const double> labels, std::span<const double> predictions);
    double computeMae(std::span<const double> labels, std::span<const double> predictions);
    // 1 - SSres / SStot, NaN if all the labels are equal
    double computeR2(std::span<const double> labels, std::span<const double> predictions);

    // Labels are 0 or 1, predictions are clipped to [1e-7, 1 - 1e-7]
    double computeLogLoss(std::span<const double> labels, std::span<const double> predictions);
    // NaN if only one class is present
    double computeRocAuc(std::span<const double> labels, std::span<const double> predictions);
    // Average precision over the whole ranking, NaN if there is no positive
    double computePrAuc(std::span<const double> labels, std::span<const double> predictions);

    // Top-k metrics of a single user, recommendedItems is the ranked list, truncated to k
    double computePrecisionAtK(std::span<const dataset::Index> recommendedItems, const std::unordered_set<dataset::Index>& relevantItems, std::size_t k);
    double computeRecallAtK(std::span<const dataset::Index> recommendedItems, const std::unordered_set<dataset::Index>& relevantItems, std::size_t k);
    // Divided by min(relevant count, k)
    double computeAveragePrecisionAtK(std::span<const dataset::Index> recommendedItems, const std::unordered_set<dataset::Index>& relevantItems, std::size_t k);
    // Binary relevance
    double computeNdcgAtK(std::span<const dataset::Index> recommendedItems, const std::unordered_set<dataset::Index>& relevantItems, std::size_t k);
} // namespace rekit::recommendation::metrics
