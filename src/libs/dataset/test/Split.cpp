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

#include <set>
#include <string>

#include <gtest/gtest.h>

#include "dataset/Exception.hpp"
#include "dataset/Split.hpp"

#include "Common.hpp"

namespace rekit::dataset::tests
{
    namespace
    {
        std::multiset<std::string> getRowKeys(const RawTable& table)
        {
            std::multiset<std::string> res;
            for (const RawTable::Row& row : table.getRows())
                res.insert(row[0] + "/" + row[1]);

            return res;
        }

        constexpr std::string_view content{ "user,item,label,time\n"
                                            "u1,i1,1,100\n"
                                            "u1,i2,1,50\n"
                                            "u1,i3,1,300\n"
                                            "u2,i1,1,2020-01-01T00:00:00\n"
                                            "u2,i4,1,200\n"
                                            "u3,i2,1,10\n"
                                            "u3,i5,1,400\n"
                                            "u3,i1,1,250\n"
                                            "u4,i3,1,150\n"
                                            "u4,i4,1,20\n" };
    } // namespace

    TEST(Split, random)
    {
        const RawTable table{ parseTable(content) };

        RandomSplitParameters params;
        params.ratios = { 0.6, 0.2, 0.2 };
        const std::vector<RawTable> splits{ splitRandom(table, Schema{}, params) };

        ASSERT_EQ(splits.size(), 3);
        EXPECT_EQ(splits[0].getRowCount(), 6);
        EXPECT_EQ(splits[1].getRowCount(), 2);
        EXPECT_EQ(splits[2].getRowCount(), 2);

        std::multiset<std::string> keys;
        for (const RawTable& split : splits)
        {
            EXPECT_EQ(split.getColumnNames(), table.getColumnNames());
            keys.merge(getRowKeys(split));
        }
        EXPECT_EQ(keys, getRowKeys(table));

        // reproducible
        const std::vector<RawTable> otherSplits{ splitRandom(table, Schema{}, params) };
        EXPECT_EQ(otherSplits[1].getRows(), splits[1].getRows());
    }

    TEST(Split, randomFilterUnknown)
    {
        const RawTable table{ parseTable(content) };

        RandomSplitParameters params;
        params.ratios = { 0.5, 0.5 };
        params.filterUnknown = true;
        const std::vector<RawTable> splits{ splitRandom(table, Schema{}, params) };

        ASSERT_EQ(splits.size(), 2);
        EXPECT_EQ(splits[0].getRowCount(), 5);

        std::set<std::string> trainUsers;
        std::set<std::string> trainItems;
        for (const RawTable::Row& row : splits[0].getRows())
        {
            trainUsers.insert(row[0]);
            trainItems.insert(row[1]);
        }

        for (const RawTable::Row& row : splits[1].getRows())
        {
            EXPECT_TRUE(trainUsers.contains(row[0]));
            EXPECT_TRUE(trainItems.contains(row[1]));
        }
    }

    TEST(Split, randomRatiosSlightlyAboveOne)
    {
        std::string tableContent{ "user,item\n" };
        for (std::size_t i{}; i < 20; ++i)
            tableContent += "u" + std::to_string(i) + ",i" + std::to_string(i % 3) + "\n";
        const RawTable table{ parseTable(tableContent) };

        RandomSplitParameters params;
        params.ratios = { 0.5, 0.5000004, 0.0000005 };
        const std::vector<RawTable> splits{ splitRandom(table, Schema{}, params) };

        ASSERT_EQ(splits.size(), 3);
        EXPECT_EQ(splits[0].getRowCount(), 10);
        EXPECT_EQ(splits[1].getRowCount(), 10);
        EXPECT_EQ(splits[2].getRowCount(), 0);
    }

    TEST(Split, invalidRatios)
    {
        const RawTable table{ parseTable(content) };

        for (const std::vector<double>& ratios : { std::vector<double>{}, std::vector<double>{ 0.5, 0.4 }, std::vector<double>{ 1.2, -0.2 } })
        {
            RandomSplitParameters params;
            params.ratios = ratios;
            EXPECT_THROW(splitRandom(table, Schema{}, params), Exception);
        }
    }

    TEST(Split, chrono)
    {
        const RawTable table{ parseTable(content) };

        Schema schema;
        schema.timeColumn = "time";

        const auto [train, test]{ splitChrono(table, schema, ChronoSplitParameters{ .testRatio = 0.2, .perUser = false }) };
        ASSERT_EQ(train.getRowCount(), 8);
        ASSERT_EQ(test.getRowCount(), 2);

        // sorted by time, the ISO date is the latest one
        EXPECT_EQ(train.getRow(0)[1], "i2");
        EXPECT_EQ(test.getRow(0)[0], "u3");
        EXPECT_EQ(test.getRow(0)[1], "i5");
        EXPECT_EQ(test.getRow(1)[0], "u2");
        EXPECT_EQ(test.getRow(1)[1], "i1");
    }

    TEST(Split, chronoPerUser)
    {
        const RawTable table{ parseTable(content) };

        Schema schema;
        schema.timeColumn = "time";

        const auto [train, test]{ splitChrono(table, schema, ChronoSplitParameters{ .testRatio = 0.4, .perUser = true }) };

        // round(0.4 * count) latest rows of each user
        EXPECT_EQ(getRowKeys(test), (std::multiset<std::string>{ "u1/i3", "u2/i1", "u3/i5", "u4/i3" }));
        EXPECT_EQ(train.getRowCount(), 6);
    }

    TEST(Split, chronoErrors)
    {
        const RawTable table{ parseTable(content) };

        EXPECT_THROW(splitChrono(table, Schema{}, ChronoSplitParameters{}), Exception);

        Schema schema;
        schema.timeColumn = "time";
        EXPECT_THROW(splitChrono(parseTable("user,item,time\nu1,i1,yesterday\n"), schema, ChronoSplitParameters{}), MalformedInputException);
        EXPECT_THROW(splitChrono(table, schema, ChronoSplitParameters{ .testRatio = 1. }), Exception);
    }

    TEST(Split, byCount)
    {
        const RawTable table{ parseTable(content) };

        const auto [train, test]{ splitByCount(table, Schema{}, 1, 42) };

        std::multiset<std::string> testUsers;
        for (const RawTable::Row& row : test.getRows())
            testUsers.insert(row[0]);

        EXPECT_EQ(testUsers, (std::multiset<std::string>{ "u1", "u2", "u3", "u4" }));
        EXPECT_EQ(train.getRowCount(), 6);

        // users with too few interactions stay in the train set
        const auto [train2, test2]{ splitByCount(table, Schema{}, 2, 42) };
        EXPECT_EQ(test2.getRowCount(), 4);
        EXPECT_EQ(train2.getRowCount(), 6);
    }

    TEST(Split, parseTimestamp)
    {
        EXPECT_EQ(parseTimestamp("1700000000"), 1700000000);
        EXPECT_EQ(parseTimestamp("1970-01-01T00:01:00"), 60);
        EXPECT_EQ(parseTimestamp("1970-01-02"), 86400);
        EXPECT_EQ(parseTimestamp("not a date"), std::nullopt);
    }
} // namespace rekit::dataset::tests
