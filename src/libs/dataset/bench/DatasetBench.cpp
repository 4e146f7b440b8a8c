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

#include <cstdint>
#include <string>

#include <benchmark/benchmark.h>

#include "dataset/NegativeSampler.hpp"
#include "dataset/TableBuilder.hpp"

namespace rekit::dataset::benchmarks
{
    namespace
    {
        RawTable generateTable(std::size_t userCount, std::size_t itemsPerUser, std::size_t itemCount)
        {
            RawTable table{ std::vector<std::string>{ "user", "item", "label", "city", "genres", "age" } };

            core::random::RandGenerator generator{ core::random::createSeededGenerator(0) };
            for (std::size_t user{}; user < userCount; ++user)
            {
                for (std::size_t i{}; i < itemsPerUser; ++i)
                {
                    const std::size_t item{ core::random::getRandom<std::size_t>(generator, 0, itemCount - 1) };
                    table.addRow({ "u" + std::to_string(user),
                        "i" + std::to_string(item),
                        "1",
                        "city" + std::to_string(user % 50),
                        "g" + std::to_string(item % 20) + "|g" + std::to_string(item % 7),
                        std::to_string(18 + user % 60) });
                }
            }

            return table;
        }

        Schema createSchema()
        {
            Schema schema;
            schema.sparseColumns = { "city" };
            schema.multiSparseColumns = { "genres" };
            schema.denseColumns = { "age" };
            schema.userColumns = { "city", "age" };
            schema.itemColumns = { "genres" };
            schema.standardizeDense = true;

            return schema;
        }
    } // namespace

    static void BM_Dataset_buildTrainSet(benchmark::State& state)
    {
        const RawTable table{ generateTable(state.range(0), 20, 1000) };

        for (auto _ : state)
        {
            TableBuilder builder{ createSchema(), Task::Ranking };
            benchmark::DoNotOptimize(builder.buildTrainSet(table));
        }

        state.SetItemsProcessed(state.iterations() * static_cast<std::int64_t>(table.getRowCount()));
    }

    static void BM_Dataset_buildTestSet(benchmark::State& state)
    {
        const RawTable table{ generateTable(state.range(0), 20, 1000) };

        TableBuilder builder{ createSchema(), Task::Ranking };
        builder.buildTrainSet(table);

        for (auto _ : state)
            benchmark::DoNotOptimize(builder.buildTestSet(table));

        state.SetItemsProcessed(state.iterations() * static_cast<std::int64_t>(table.getRowCount()));
    }

    static void BM_Dataset_sampleNegatives(benchmark::State& state)
    {
        const RawTable table{ generateTable(1000, 20, 1000) };

        TableBuilder builder{ createSchema(), Task::Ranking };
        const RecordSet records{ builder.buildTrainSet(table) };

        SamplingParameters params;
        params.negativesPerPositive = 4;
        params.distribution = static_cast<SamplingDistribution>(state.range(0));

        for (auto _ : state)
            benchmark::DoNotOptimize(sampleNegatives(records, builder.getDatasetInfo(), params));

        state.SetItemsProcessed(state.iterations() * static_cast<std::int64_t>(records.size() * params.negativesPerPositive));
    }

    BENCHMARK(BM_Dataset_buildTrainSet)->Arg(100)->Arg(1000);
    BENCHMARK(BM_Dataset_buildTestSet)->Arg(100)->Arg(1000);
    BENCHMARK(BM_Dataset_sampleNegatives)->Arg(static_cast<int>(SamplingDistribution::Uniform))->Arg(static_cast<int>(SamplingDistribution::Popular));
} // namespace rekit::dataset::benchmarks

BENCHMARK_MAIN();
