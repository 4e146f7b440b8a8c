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

#include "dataset/NegativeSampler.hpp"

#include <algorithm>
#include <unordered_map>
#include <unordered_set>

#include "core/ILogger.hpp"
#include "core/String.hpp"
#include "dataset/Exception.hpp"

namespace rekit::dataset
{
    const char* getSamplingDistributionName(SamplingDistribution distribution)
    {
        switch (distribution)
        {
        case SamplingDistribution::Uniform:
            return "uniform";
        case SamplingDistribution::Unconsumed:
            return "unconsumed";
        case SamplingDistribution::Popular:
            return "popular";
        }

        return "";
    }

    std::optional<SamplingDistribution> parseSamplingDistribution(std::string_view str)
    {
        for (SamplingDistribution distribution : { SamplingDistribution::Uniform, SamplingDistribution::Unconsumed, SamplingDistribution::Popular })
        {
            if (core::stringUtils::stringCaseInsensitiveEqual(str, getSamplingDistributionName(distribution)))
                return distribution;
        }

        return std::nullopt;
    }

    NegativeSampler::NegativeSampler(const DatasetInfo& datasetInfo, const SamplingParameters& params)
        : _datasetInfo{ datasetInfo }
        , _params{ params }
        , _generator{ core::random::createSeededGenerator(params.seed) }
    {
        if (_datasetInfo.getTask() != Task::Ranking)
            throw Exception{ "Negative sampling is only available for ranking tasks" };
        if (_datasetInfo.getItemCount() == 0)
            throw Exception{ "Cannot sample negatives: no registered item" };

        if (_params.distribution == SamplingDistribution::Popular)
        {
            _cumulativeWeights.reserve(_datasetInfo.getItemCount());

            double total{};
            for (Index item{}; item < _datasetInfo.getItemCount(); ++item)
            {
                total += static_cast<double>(_datasetInfo.getItemPopularity(item));
                _cumulativeWeights.push_back(total);
            }
        }
    }

    Index NegativeSampler::drawItem()
    {
        switch (_params.distribution)
        {
        case SamplingDistribution::Uniform:
        case SamplingDistribution::Unconsumed:
            break;

        case SamplingDistribution::Popular:
            {
                const double value{ core::random::getRealRandom(_generator, 0., _cumulativeWeights.back()) };
                const auto it{ std::upper_bound(std::cbegin(_cumulativeWeights), std::cend(_cumulativeWeights), value) };
                if (it != std::cend(_cumulativeWeights))
                    return static_cast<Index>(std::distance(std::cbegin(_cumulativeWeights), it));

                return _cumulativeWeights.size() - 1;
            }
        }

        return core::random::getRandom<Index>(_generator, 0, _datasetInfo.getItemCount() - 1);
    }

    bool NegativeSampler::isRejected(Index user, Index item, const std::unordered_set<Index>& positives) const
    {
        if (positives.contains(item))
            return true;

        return _params.distribution == SamplingDistribution::Unconsumed && _datasetInfo.hasConsumed(user, item);
    }

    RecordSet NegativeSampler::sample(const RecordSet& records)
    {
        const FeatureEncoder& encoder{ _datasetInfo.getFeatureEncoder() };
        SamplingStats stats;

        // positives of each user within this record set
        std::unordered_map<Index, std::unordered_set<Index>> userPositives;
        for (std::size_t row{}; row < records.size(); ++row)
        {
            if (records.isResolved(row) && records.getLabels()[row] > 0)
                userPositives[records.getUserIndices()[row]].insert(records.getItemIndices()[row]);
        }

        RecordColumns columns;
        columns.sparseFieldCount = records.getSparseFieldCount();
        columns.multiSparseWidth = records.getMultiSparseWidth();
        columns.denseFieldCount = records.getDenseFieldCount();

        for (std::size_t row{}; row < records.size(); ++row)
        {
            if (!records.isResolved(row))
            {
                stats.skippedCount += 1;
                continue;
            }

            const RecordView record{ records.getRecord(row) };
            const EncodedFeatures features{ records.getFeatures(row) };

            if (record.label <= 0)
            {
                columns.append(record.user, record.item, 0, record.negativeKind, features);
                continue;
            }

            stats.positiveCount += 1;
            columns.append(record.user, record.item, 1, NegativeKind::None, features);

            const std::unordered_set<Index>& positives{ userPositives[record.user] };
            for (std::size_t i{}; i < _params.negativesPerPositive; ++i)
            {
                Index item{ drawItem() };
                NegativeKind kind{ NegativeKind::Sampled };
                for (std::size_t retry{}; isRejected(record.user, item, positives); ++retry)
                {
                    if (retry == _params.maxRetries)
                    {
                        kind = NegativeKind::Fallback;
                        break;
                    }
                    item = drawItem();
                }

                EncodedFeatures negativeFeatures{ features };
                if (const EncodedFeatures* itemFeatures{ _datasetInfo.getItemFeatures(item) })
                    encoder.assignAssociatedFeatures(negativeFeatures, *itemFeatures, FieldAssociation::Item);

                columns.append(record.user, item, 0, kind, negativeFeatures);
                if (kind == NegativeKind::Fallback)
                    stats.fallbackCount += 1;
                else
                    stats.sampledCount += 1;
            }
        }

        RecordSet res{ std::move(columns) };
        _stats = stats;

        REKIT_LOG(SAMPLER, INFO, "Sampled " << (stats.sampledCount + stats.fallbackCount) << " negatives for " << stats.positiveCount << " positives using " << getSamplingDistributionName(_params.distribution) << " distribution");
        REKIT_LOG_IF(SAMPLER, WARNING, stats.fallbackCount > 0, stats.fallbackCount << " negatives accepted after " << _params.maxRetries << " rejected draws");
        REKIT_LOG_IF(SAMPLER, DEBUG, stats.skippedCount > 0, "Skipped " << stats.skippedCount << " records with unknown user or item");

        return res;
    }

    RecordSet sampleNegatives(const RecordSet& records, const DatasetInfo& datasetInfo, const SamplingParameters& params)
    {
        NegativeSampler sampler{ datasetInfo, params };
        return sampler.sample(records);
    }
} // namespace rekit::dataset
