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

#include <cstdint>
#include <optional>
#include <string_view>
#include <unordered_set>
#include <vector>

#include "core/Random.hpp"
#include "dataset/DatasetInfo.hpp"
#include "dataset/RecordSet.hpp"

namespace rekit::dataset
{
    enum class SamplingDistribution
    {
        Uniform,
        Unconsumed, // uniform, also rejects the items the user consumed in the training sets
        Popular,    // weighted by the training interaction count of each item
    };
    const char* getSamplingDistributionName(SamplingDistribution distribution);
    std::optional<SamplingDistribution> parseSamplingDistribution(std::string_view str);

    struct SamplingParameters
    {
        std::size_t negativesPerPositive{ 1 };
        SamplingDistribution distribution{ SamplingDistribution::Uniform };
        std::size_t maxRetries{ 10 }; // rejected draws per negative before accepting a fallback
        std::uint_fast32_t seed{ 42 };
    };

    struct SamplingStats
    {
        std::size_t positiveCount{};
        std::size_t sampledCount{};
        std::size_t fallbackCount{}; // negatives that may collide with a positive
        std::size_t skippedCount{};  // records with unknown user or item
    };

    // Augments implicit feedback record sets with synthesized negatives.
    // Negative items are only drawn from the registered ones, the DatasetInfo is never modified
    class NegativeSampler
    {
    public:
        NegativeSampler(const DatasetInfo& datasetInfo, const SamplingParameters& params);
        ~NegativeSampler() = default;
        NegativeSampler(const NegativeSampler&) = delete;
        NegativeSampler& operator=(const NegativeSampler&) = delete;

        // Each positive record is kept with label 1 and followed by its negatives with label 0
        RecordSet sample(const RecordSet& records);

        const SamplingStats& getStats() const { return _stats; }

    private:
        Index drawItem();
        bool isRejected(Index user, Index item, const std::unordered_set<Index>& positives) const;

        const DatasetInfo& _datasetInfo;
        const SamplingParameters _params;
        core::random::RandGenerator _generator;
        std::vector<double> _cumulativeWeights; // popular distribution only
        SamplingStats _stats;
    };

    RecordSet sampleNegatives(const RecordSet& records, const DatasetInfo& datasetInfo, const SamplingParameters& params);
} // namespace rekit::dataset
