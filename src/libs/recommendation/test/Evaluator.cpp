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

#include <cmath>

#include <gtest/gtest.h>

#include "dataset/Exception.hpp"
#include "dataset/TableBuilder.hpp"
#include "recommendation/Evaluator.hpp"
#include "recommendation/IRecommender.hpp"
#include "recommendation/Models.hpp"

#include "Common.hpp"

namespace rekit::recommendation::tests
{
    TEST(Evaluator, ratingMetrics)
    {
        dataset::TableBuilder builder{ dataset::Schema{}, dataset::Task::Rating };
        const dataset::RecordSet trainSet{ builder.buildTrainSet(parseTable("user,item,rating\nu1,i1,5\nu2,i1,3\nu3,i2,4\n")) };

        const auto model{ createPopularityModel(builder.getDatasetInfo()) };
        model->fit(trainSet);
        const auto recommender{ createRecommender(builder.getDatasetInfo(), *model) };

        const dataset::RecordSet evalSet{ builder.buildEvalSet(parseTable("user,item,rating\nu1,i2,4\nu2,i2,2\nu9,i1,4\n")) };
        const Metric metrics[]{ Metric::RMSE, Metric::MAE, Metric::R2 };

        for (std::size_t batchSize : { 1, 2, 8192 })
        {
            EvaluationParameters params;
            params.batchSize = batchSize;

            const std::map<Metric, double> res{ evaluate(*recommender, evalSet, metrics, params) };
            ASSERT_EQ(res.size(), 3);
            EXPECT_DOUBLE_EQ(res.at(Metric::RMSE), std::sqrt(4. / 3));
            EXPECT_DOUBLE_EQ(res.at(Metric::MAE), 2. / 3);
            EXPECT_NEAR(res.at(Metric::R2), -0.5, 1e-12);
        }

        EvaluationParameters params;
        params.coldStart = ColdStartPolicy::Fail;
        EXPECT_THROW(evaluate(*recommender, evalSet, metrics, params), dataset::UnknownEntityException);
    }

    TEST(Evaluator, rankingMetrics)
    {
        dataset::TableBuilder builder{ dataset::Schema{}, dataset::Task::Ranking };
        const dataset::RecordSet trainSet{ builder.buildTrainSet(parseTable("user,item\nu1,i1\nu2,i1\nu2,i2\nu3,i2\nu3,i3\n")) };

        const auto model{ createPopularityModel(builder.getDatasetInfo()) };
        model->fit(trainSet);
        const auto recommender{ createRecommender(builder.getDatasetInfo(), *model) };

        const dataset::RecordSet testSet{ builder.buildTestSet(parseTable("user,item,label\nu1,i2,1\nu1,i3,0\nu3,i1,1\nu9,i3,0\n")) };
        const Metric metrics[]{ Metric::RocAuc, Metric::PrAuc, Metric::LogLoss, Metric::Precision, Metric::Recall, Metric::MAP, Metric::NDCG };

        EvaluationParameters params;
        params.k = 2;
        const std::map<Metric, double> res{ evaluate(*recommender, testSet, metrics, params) };

        ASSERT_EQ(res.size(), 7);
        EXPECT_DOUBLE_EQ(res.at(Metric::RocAuc), 0.75);
        EXPECT_TRUE(std::isfinite(res.at(Metric::LogLoss)));
        EXPECT_DOUBLE_EQ(res.at(Metric::Precision), 0.5);
        EXPECT_DOUBLE_EQ(res.at(Metric::Recall), 1);
        EXPECT_DOUBLE_EQ(res.at(Metric::MAP), 1);
        EXPECT_DOUBLE_EQ(res.at(Metric::NDCG), 1);
    }

    TEST(Evaluator, incompatibleMetrics)
    {
        dataset::TableBuilder builder{ dataset::Schema{}, dataset::Task::Rating };
        const dataset::RecordSet trainSet{ builder.buildTrainSet(parseTable("user,item,rating\nu1,i1,5\n")) };

        const auto model{ createPopularityModel(builder.getDatasetInfo()) };
        model->fit(trainSet);
        const auto recommender{ createRecommender(builder.getDatasetInfo(), *model) };

        for (Metric metric : { Metric::LogLoss, Metric::RocAuc, Metric::PrAuc, Metric::Precision, Metric::Recall, Metric::MAP, Metric::NDCG })
        {
            const Metric metrics[]{ Metric::RMSE, metric };
            EXPECT_THROW(evaluate(*recommender, trainSet, metrics, EvaluationParameters{}), IncompatibleMetricException) << getMetricName(metric);
        }
    }

    TEST(Evaluator, metricNames)
    {
        struct TestCase
        {
            std::string_view name;
            Metric expectedMetric;
            bool rating;
        };

        const TestCase tests[]{
            { "rmse", Metric::RMSE, true },
            { "mae", Metric::MAE, true },
            { "r2", Metric::R2, true },
            { "loss", Metric::LogLoss, false },
            { "roc_auc", Metric::RocAuc, false },
            { "pr_auc", Metric::PrAuc, false },
            { "precision", Metric::Precision, false },
            { "recall", Metric::Recall, false },
            { "map", Metric::MAP, false },
            { "NDCG", Metric::NDCG, false },
        };

        for (const TestCase& test : tests)
        {
            EXPECT_EQ(parseMetric(test.name), test.expectedMetric);
            EXPECT_EQ(isMetricCompatible(test.expectedMetric, dataset::Task::Rating), test.rating);
            EXPECT_EQ(isMetricCompatible(test.expectedMetric, dataset::Task::Ranking), !test.rating);
        }

        EXPECT_THROW(parseMetric("hit_rate"), IncompatibleMetricException);
        EXPECT_THROW(parseMetric(""), IncompatibleMetricException);
    }
} // namespace rekit::recommendation::tests
