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

#include "dataset/TableBuilder.hpp"
#include "recommendation/Models.hpp"
#include "recommendation/Types.hpp"

#include "Common.hpp"

namespace rekit::recommendation::tests
{
    TEST(PopularityModel, ranking)
    {
        dataset::TableBuilder builder{ dataset::Schema{}, dataset::Task::Ranking };
        const dataset::RecordSet trainSet{ builder.buildTrainSet(parseTable("user,item,label\nu1,i1,1\nu2,i1,1\nu1,i2,1\nu3,i3,0\nu4,i1,1\n")) };

        const auto model{ createPopularityModel(builder.getDatasetInfo()) };
        model->fit(trainSet);

        EXPECT_EQ(model->getName(), "popular");
        // negatives are not counted
        EXPECT_EQ(model->scoreAllItems(0), (std::vector<double>{ 1, 1. / 3, 0 }));
        EXPECT_DOUBLE_EQ(model->predict(3, 1), 1. / 3);
        EXPECT_EQ(model->scoreAllItemsForUnknownUser(), model->scoreAllItems(2));
    }

    TEST(PopularityModel, rating)
    {
        dataset::TableBuilder builder{ dataset::Schema{}, dataset::Task::Rating };
        const dataset::RecordSet trainSet{ builder.buildTrainSet(parseTable("user,item,rating\nu1,i1,5\nu2,i1,2\nu1,i2,3\n")) };

        const auto model{ createPopularityModel(builder.getDatasetInfo()) };
        model->fit(trainSet);

        EXPECT_DOUBLE_EQ(model->predict(0, 0), 3.5);
        EXPECT_DOUBLE_EQ(model->predict(1, 1), 3);

        // item registered after the fit
        builder.buildTrainSet(parseTable("user,item,rating\nu3,i3,1\n"));
        const std::vector<double> scores{ model->scoreAllItemsForUnknownUser() };
        ASSERT_EQ(scores.size(), 3);
        EXPECT_DOUBLE_EQ(scores[2], 10. / 3);
    }

    TEST(UserCFModel, ranking)
    {
        dataset::TableBuilder builder{ dataset::Schema{}, dataset::Task::Ranking };
        const dataset::RecordSet trainSet{ builder.buildTrainSet(parseTable("user,item\n"
                                                                            "u1,i1\nu1,i2\n"
                                                                            "u2,i1\nu2,i2\nu2,i3\n"
                                                                            "u3,i4\n"
                                                                            "u4,i1\n")) };

        const auto model{ createUserCFModel(builder.getDatasetInfo(), UserCFParameters{ .neighborCount = 10 }) };
        model->fit(trainSet);
        EXPECT_EQ(model->getName(), "usercf");

        // u1 neighbors: u2 (2 / sqrt(2 * 3)) and u4 (1 / sqrt(2))
        const double simU2{ 2 / (std::sqrt(2.) * std::sqrt(3.)) };
        const double simU4{ 1 / (std::sqrt(2.) * std::sqrt(1.)) };
        const std::vector<double> scores{ model->scoreAllItems(0) };
        ASSERT_EQ(scores.size(), 4);
        EXPECT_DOUBLE_EQ(scores[0], 1);
        EXPECT_NEAR(scores[1], simU2 / (simU2 + simU4), 1e-12);
        EXPECT_NEAR(scores[2], simU2 / (simU2 + simU4), 1e-12);
        EXPECT_DOUBLE_EQ(scores[3], 0);
        EXPECT_DOUBLE_EQ(model->predict(0, 2), scores[2]);

        // no neighbor
        EXPECT_EQ(model->scoreAllItems(2), (std::vector<double>{ 0, 0, 0, 0 }));

        // average user: share of users having consumed each item
        EXPECT_EQ(model->scoreAllItemsForUnknownUser(), (std::vector<double>{ 0.75, 0.5, 0.25, 0.25 }));
    }

    TEST(UserCFModel, neighborCount)
    {
        dataset::TableBuilder builder{ dataset::Schema{}, dataset::Task::Ranking };
        const dataset::RecordSet trainSet{ builder.buildTrainSet(parseTable("user,item\n"
                                                                            "u1,i1\nu1,i2\n"
                                                                            "u2,i1\nu2,i2\nu2,i3\n"
                                                                            "u3,i4\n"
                                                                            "u4,i1\n")) };

        const auto model{ createUserCFModel(builder.getDatasetInfo(), UserCFParameters{ .neighborCount = 1 }) };
        model->fit(trainSet);

        // u2 is the only neighbor of u1
        EXPECT_EQ(model->scoreAllItems(0), (std::vector<double>{ 1, 1, 1, 0 }));

        EXPECT_THROW(createUserCFModel(builder.getDatasetInfo(), UserCFParameters{ .neighborCount = 0 }), Exception);
    }

    TEST(UserCFModel, rating)
    {
        dataset::TableBuilder builder{ dataset::Schema{}, dataset::Task::Rating };
        const dataset::RecordSet trainSet{ builder.buildTrainSet(parseTable("user,item,rating\n"
                                                                            "u1,i1,5\nu1,i2,3\n"
                                                                            "u2,i1,4\nu2,i2,2\nu2,i3,5\n"
                                                                            "u3,i3,1\n"
                                                                            "u4,i4,3\n")) };

        const auto model{ createUserCFModel(builder.getDatasetInfo(), UserCFParameters{}) };
        model->fit(trainSet);

        // u2 is the only neighbor of u1 having rated i3
        EXPECT_DOUBLE_EQ(model->predict(0, 2), 5);
        EXPECT_DOUBLE_EQ(model->predict(2, 0), 4);

        // u4 has no neighbor: item mean
        EXPECT_DOUBLE_EQ(model->predict(3, 0), 4.5);
        EXPECT_EQ(model->scoreAllItemsForUnknownUser(), (std::vector<double>{ 4.5, 2.5, 3, 3 }));

        const std::vector<double> scores{ model->scoreAllItems(0) };
        ASSERT_EQ(scores.size(), 4);
        EXPECT_DOUBLE_EQ(scores[2], 5);
        EXPECT_DOUBLE_EQ(scores[3], 3);
    }
} // namespace rekit::recommendation::tests
