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

#include <map>
#include <set>

#include <gtest/gtest.h>

#include "dataset/Exception.hpp"
#include "dataset/NegativeSampler.hpp"
#include "dataset/TableBuilder.hpp"

#include "Common.hpp"

namespace rekit::dataset::tests
{
    namespace
    {
        constexpr std::string_view trainContent{ "user,item\n"
                                                 "u1,i1\nu1,i2\nu1,i3\n"
                                                 "u2,i1\nu2,i4\n"
                                                 "u3,i5\nu3,i6\nu3,i7\nu3,i8\n" };
    } // namespace

    TEST(NegativeSampler, excludesPositives)
    {
        TableBuilder builder{ Schema{}, Task::Ranking };
        const RecordSet train{ builder.buildTrainSet(parseTable(trainContent)) };

        SamplingParameters params;
        params.negativesPerPositive = 3;
        params.maxRetries = 100;

        NegativeSampler sampler{ builder.getDatasetInfo(), params };
        const RecordSet res{ sampler.sample(train) };

        ASSERT_EQ(res.size(), train.size() * 4);
        EXPECT_EQ(sampler.getStats().positiveCount, train.size());
        EXPECT_EQ(sampler.getStats().sampledCount + sampler.getStats().fallbackCount, train.size() * 3);

        std::map<Index, std::set<Index>> positives;
        for (std::size_t row{}; row < train.size(); ++row)
            positives[train.getUserIndices()[row]].insert(train.getItemIndices()[row]);

        for (std::size_t row{}; row < res.size(); ++row)
        {
            const RecordView record{ res.getRecord(row) };
            if (row % 4 == 0)
            {
                EXPECT_EQ(record.negativeKind, NegativeKind::None);
                EXPECT_DOUBLE_EQ(record.label, 1);
                EXPECT_EQ(record.user, train.getUserIndices()[row / 4]);
                EXPECT_EQ(record.item, train.getItemIndices()[row / 4]);
                continue;
            }

            EXPECT_DOUBLE_EQ(record.label, 0);
            EXPECT_EQ(record.user, train.getUserIndices()[row / 4]);
            EXPECT_LT(record.item, builder.getDatasetInfo().getItemCount());
            if (record.negativeKind == NegativeKind::Sampled)
                EXPECT_FALSE(positives[record.user].contains(record.item)) << "row " << row;
            else
                EXPECT_EQ(record.negativeKind, NegativeKind::Fallback);
        }

        // the sampler never registers anything
        EXPECT_EQ(builder.getDatasetInfo().getItemCount(), 8);
        EXPECT_EQ(builder.getDatasetInfo().getInteractionCount(), train.size());
    }

    TEST(NegativeSampler, fallbackOnDenseUser)
    {
        TableBuilder builder{ Schema{}, Task::Ranking };
        const RecordSet train{ builder.buildTrainSet(parseTable("user,item\nu1,i1\nu1,i2\nu2,i1\n")) };

        SamplingParameters params;
        params.negativesPerPositive = 2;
        params.maxRetries = 50;

        NegativeSampler sampler{ builder.getDatasetInfo(), params };
        const RecordSet res{ sampler.sample(train) };

        // u1 consumed every item: its negatives can only be fallbacks
        ASSERT_EQ(res.size(), 9);
        for (std::size_t row : { 1, 2, 4, 5 })
            EXPECT_EQ(res.getNegativeKinds()[row], NegativeKind::Fallback);

        EXPECT_EQ(sampler.getStats().fallbackCount, 4);
        EXPECT_EQ(sampler.getStats().sampledCount, 2);
    }

    TEST(NegativeSampler, deterministic)
    {
        TableBuilder builder{ Schema{}, Task::Ranking };
        const RecordSet train{ builder.buildTrainSet(parseTable(trainContent)) };

        for (SamplingDistribution distribution : { SamplingDistribution::Uniform, SamplingDistribution::Popular })
        {
            SamplingParameters params;
            params.negativesPerPositive = 2;
            params.distribution = distribution;
            params.seed = 1234;

            const RecordSet first{ sampleNegatives(train, builder.getDatasetInfo(), params) };
            const RecordSet second{ sampleNegatives(train, builder.getDatasetInfo(), params) };

            ASSERT_EQ(first.size(), second.size());
            for (std::size_t row{}; row < first.size(); ++row)
                EXPECT_EQ(first.getItemIndices()[row], second.getItemIndices()[row]);
        }
    }

    TEST(NegativeSampler, popularDistribution)
    {
        // i1 is by far the most popular item
        TableBuilder builder{ Schema{}, Task::Ranking };
        builder.buildTrainSet(parseTable("user,item\nu1,i1\nu2,i1\nu3,i1\nu4,i1\nu5,i1\nu6,i1\nu7,i1\nu8,i1\nu9,i2\nu9,i3\n"));
        const RecordSet queries{ builder.buildEvalSet(parseTable("user,item\nu9,i2\n")) };

        SamplingParameters params;
        params.negativesPerPositive = 1000;
        params.distribution = SamplingDistribution::Popular;

        const RecordSet res{ sampleNegatives(queries, builder.getDatasetInfo(), params) };

        std::size_t i1Count{};
        for (std::size_t row{ 1 }; row < res.size(); ++row)
        {
            if (res.getItemIndices()[row] == 0)
                ++i1Count;
        }

        // weights are 8, 1 and 1, i2 is rejected
        EXPECT_GT(i1Count, 800);
    }

    TEST(NegativeSampler, itemFeatures)
    {
        Schema schema;
        schema.sparseColumns = { "category", "device" };
        schema.itemColumns = { "category" };

        TableBuilder builder{ schema, Task::Ranking };
        const RecordSet train{ builder.buildTrainSet(parseTable("user,item,label,category,device\n"
                                                                "u1,i1,1,book,phone\n"
                                                                "u2,i2,1,music,desktop\n"
                                                                "u3,i3,1,movie,tablet\n")) };

        SamplingParameters params;
        params.negativesPerPositive = 4;
        const RecordSet res{ sampleNegatives(train, builder.getDatasetInfo(), params) };

        const DatasetInfo& info{ builder.getDatasetInfo() };
        for (std::size_t row{}; row < res.size(); ++row)
        {
            const RecordView record{ res.getRecord(row) };
            const RecordView positive{ train.getRecord(row / 5) };

            // item features follow the sampled item, the others are copied from the positive
            EXPECT_EQ(record.sparseIndices[0], info.getItemFeatures(record.item)->sparse[0]);
            EXPECT_EQ(record.sparseIndices[1], positive.sparseIndices[1]);
        }
    }

    TEST(NegativeSampler, skipsUnresolvedRecords)
    {
        TableBuilder builder{ Schema{}, Task::Ranking };
        builder.buildTrainSet(parseTable(trainContent));

        const RecordSet evalSet{ builder.buildEvalSet(parseTable("user,item\nu1,i4\nu42,i1\nu2,i42\n")) };
        NegativeSampler sampler{ builder.getDatasetInfo(), SamplingParameters{} };
        const RecordSet res{ sampler.sample(evalSet) };

        EXPECT_EQ(res.size(), 2);
        EXPECT_EQ(sampler.getStats().skippedCount, 2);
        EXPECT_EQ(res.getUnresolvedCount(), 0);
    }

    TEST(NegativeSampler, keepsExistingNegatives)
    {
        TableBuilder builder{ Schema{}, Task::Ranking };
        const RecordSet train{ builder.buildTrainSet(parseTable("user,item,label\nu1,i1,1\nu1,i2,0\nu2,i3,1\n")) };

        NegativeSampler sampler{ builder.getDatasetInfo(), SamplingParameters{} };
        const RecordSet res{ sampler.sample(train) };

        ASSERT_EQ(res.size(), 5);
        EXPECT_EQ(sampler.getStats().positiveCount, 2);
        EXPECT_EQ(res.getItemIndices()[2], 1);
        EXPECT_DOUBLE_EQ(res.getLabels()[2], 0);
        EXPECT_EQ(res.getNegativeKinds()[2], NegativeKind::None);
    }

    TEST(NegativeSampler, unconsumedExcludesTrainingItems)
    {
        TableBuilder builder{ Schema{}, Task::Ranking };
        builder.buildTrainSet(parseTable("user,item\nu1,i1\nu1,i2\nu2,i3\nu2,i4\n"));
        const RecordSet test{ builder.buildTestSet(parseTable("user,item\nu1,i3\n")) };

        SamplingParameters params;
        params.negativesPerPositive = 5;
        params.distribution = SamplingDistribution::Unconsumed;
        params.maxRetries = 200;

        NegativeSampler sampler{ builder.getDatasetInfo(), params };
        const RecordSet res{ sampler.sample(test) };

        // i1 and i2 consumed in training, i3 positive here: only i4 is left
        ASSERT_EQ(res.size(), 6);
        EXPECT_EQ(sampler.getStats().fallbackCount, 0);
        for (std::size_t row{ 1 }; row < res.size(); ++row)
        {
            EXPECT_EQ(res.getNegativeKinds()[row], NegativeKind::Sampled);
            EXPECT_EQ(res.getItemIndices()[row], 3);
        }
    }

    TEST(NegativeSampler, invalidUsage)
    {
        {
            TableBuilder builder{ Schema{}, Task::Rating };
            builder.buildTrainSet(parseTable("user,item,rating\nu1,i1,5\n"));
            EXPECT_THROW(NegativeSampler(builder.getDatasetInfo(), SamplingParameters{}), Exception);
        }
        {
            TableBuilder builder{ Schema{}, Task::Ranking };
            EXPECT_THROW(NegativeSampler(builder.getDatasetInfo(), SamplingParameters{}), Exception);
        }
    }

    TEST(NegativeSampler, parseSamplingDistribution)
    {
        EXPECT_EQ(parseSamplingDistribution("uniform"), SamplingDistribution::Uniform);
        EXPECT_EQ(parseSamplingDistribution("Popular"), SamplingDistribution::Popular);
        EXPECT_EQ(parseSamplingDistribution("unconsumed"), SamplingDistribution::Unconsumed);
        EXPECT_EQ(parseSamplingDistribution("random"), std::nullopt);
    }
} // namespace rekit::dataset::tests
