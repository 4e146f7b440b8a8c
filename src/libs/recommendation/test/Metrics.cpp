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

#include "recommendation/Metrics.hpp"
#include "recommendation/Types.hpp"

namespace rekit::recommendation::metrics::tests
{
    TEST(Metrics, rating)
    {
        const double labels[]{ 4, 2, 4 };
        const double predictions[]{ 4, 4, 4 };

        EXPECT_DOUBLE_EQ(computeRmse(labels, predictions), std::sqrt(4. / 3));
        EXPECT_DOUBLE_EQ(computeMae(labels, predictions), 2. / 3);
        EXPECT_NEAR(computeR2(labels, predictions), -0.5, 1e-12);
        EXPECT_DOUBLE_EQ(computeR2(labels, labels), 1);

        const double constantLabels[]{ 3, 3 };
        const double otherPredictions[]{ 1, 2 };
        EXPECT_TRUE(std::isnan(computeR2(constantLabels, otherPredictions)));
    }

    TEST(Metrics, sizeMismatch)
    {
        const double labels[]{ 1, 0 };
        const double predictions[]{ 0.5 };

        EXPECT_THROW(computeRmse(labels, predictions), Exception);
        EXPECT_THROW(computeRocAuc(labels, predictions), Exception);
    }

    TEST(Metrics, logLoss)
    {
        const double labels[]{ 1, 0 };
        const double predictions[]{ 0.8, 0.2 };
        EXPECT_NEAR(computeLogLoss(labels, predictions), -std::log(0.8), 1e-12);

        // clipped
        const double extremePredictions[]{ 0, 1 };
        EXPECT_NEAR(computeLogLoss(labels, extremePredictions), -std::log(1e-7), 1e-6);
    }

    TEST(Metrics, rocAuc)
    {
        struct TestCase
        {
            std::vector<double> labels;
            std::vector<double> predictions;
            double expectedAuc;
        };

        const TestCase tests[]{
            { { 1, 0, 1, 0 }, { 0.9, 0.8, 0.3, 0.1 }, 0.75 },
            { { 1, 1, 0, 0 }, { 0.9, 0.8, 0.3, 0.1 }, 1 },
            { { 0, 0, 1, 1 }, { 0.9, 0.8, 0.3, 0.1 }, 0 },
            { { 1, 0 }, { 0.5, 0.5 }, 0.5 },
            { { 1, 0, 0 }, { 0.5, 0.5, 0.1 }, 0.75 },
        };

        for (const TestCase& test : tests)
            EXPECT_DOUBLE_EQ(computeRocAuc(test.labels, test.predictions), test.expectedAuc);

        const double labels[]{ 1, 1 };
        const double predictions[]{ 0.2, 0.4 };
        EXPECT_TRUE(std::isnan(computeRocAuc(labels, predictions)));
    }

    TEST(Metrics, prAuc)
    {
        const double labels[]{ 1, 0, 1, 0 };
        const double predictions[]{ 0.9, 0.8, 0.3, 0.1 };
        EXPECT_DOUBLE_EQ(computePrAuc(labels, predictions), (1 + 2. / 3) / 2);

        const double negatives[]{ 0, 0 };
        const double otherPredictions[]{ 0.2, 0.4 };
        EXPECT_TRUE(std::isnan(computePrAuc(negatives, otherPredictions)));
    }

    TEST(Metrics, topK)
    {
        const dataset::Index recommended[]{ 3, 1, 2 };
        const std::unordered_set<dataset::Index> relevant{ 1, 2, 5 };

        EXPECT_DOUBLE_EQ(computePrecisionAtK(recommended, relevant, 3), 2. / 3);
        EXPECT_DOUBLE_EQ(computeRecallAtK(recommended, relevant, 3), 2. / 3);
        EXPECT_DOUBLE_EQ(computeAveragePrecisionAtK(recommended, relevant, 3), (1. / 2 + 2. / 3) / 3);
        EXPECT_DOUBLE_EQ(computeNdcgAtK(recommended, relevant, 3), (1 / std::log2(3.) + 1 / std::log2(4.)) / (1 + 1 / std::log2(3.) + 1 / std::log2(4.)));

        // fewer recommendations than k
        EXPECT_DOUBLE_EQ(computePrecisionAtK(recommended, relevant, 10), 0.2);
        EXPECT_DOUBLE_EQ(computeAveragePrecisionAtK(recommended, relevant, 10), (1. / 2 + 2. / 3) / 3);

        // truncated to k
        EXPECT_DOUBLE_EQ(computePrecisionAtK(recommended, relevant, 1), 0);
        EXPECT_DOUBLE_EQ(computeNdcgAtK(recommended, relevant, 1), 0);

        const dataset::Index perfect[]{ 5, 1 };
        EXPECT_DOUBLE_EQ(computeAveragePrecisionAtK(perfect, relevant, 2), 1);
        EXPECT_DOUBLE_EQ(computeNdcgAtK(perfect, relevant, 2), 1);

        EXPECT_TRUE(std::isnan(computeRecallAtK(recommended, {}, 3)));
    }
} // namespace rekit::recommendation::metrics::tests
