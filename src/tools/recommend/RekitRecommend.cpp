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
#include <filesystem>
#include <iostream>
#include <optional>
#include <stdlib.h>

#include <boost/program_options.hpp>

#include "core/IConfig.hpp"
#include "core/ILogger.hpp"
#include "core/Service.hpp"
#include "dataset/NegativeSampler.hpp"
#include "dataset/RawTable.hpp"
#include "dataset/Split.hpp"
#include "dataset/TableBuilder.hpp"
#include "recommendation/Evaluator.hpp"
#include "recommendation/IRecommender.hpp"
#include "recommendation/Models.hpp"

namespace rekit
{
    namespace
    {
        std::vector<std::string> getStrings(core::IConfig& config, std::string_view setting)
        {
            std::vector<std::string> res;
            config.visitStrings(setting, [&](std::string_view value) { res.emplace_back(value); }, {});
            return res;
        }

        std::optional<std::string> getOptionalString(core::IConfig& config, std::string_view setting)
        {
            const std::string_view value{ config.getString(setting, "") };
            if (value.empty())
                return std::nullopt;

            return std::string{ value };
        }

        char getChar(core::IConfig& config, std::string_view setting, std::string_view def)
        {
            const std::string_view value{ config.getString(setting, def) };
            if (value.size() != 1)
                throw core::RekitException{ "Setting '" + std::string{ setting } + "' must be a single character" };

            return value.front();
        }

        dataset::Schema createSchema(core::IConfig& config)
        {
            dataset::Schema schema;
            schema.sparseColumns = getStrings(config, "sparse-columns");
            schema.multiSparseColumns = getStrings(config, "multi-sparse-columns");
            schema.denseColumns = getStrings(config, "dense-columns");
            schema.userColumns = getStrings(config, "user-columns");
            schema.itemColumns = getStrings(config, "item-columns");
            schema.multiValueSeparator = getChar(config, "multi-value-separator", "|");
            schema.standardizeDense = config.getBool("standardize-dense", false);
            schema.userIdColumn = getOptionalString(config, "user-column");
            schema.itemIdColumn = getOptionalString(config, "item-column");
            schema.labelColumn = getOptionalString(config, "label-column");
            schema.timeColumn = getOptionalString(config, "time-column");

            return schema;
        }

        std::pair<dataset::RawTable, dataset::RawTable> splitTable(core::IConfig& config, const dataset::RawTable& table, const dataset::Schema& schema)
        {
            const std::string_view splitMode{ config.getString("split-mode", "random") };
            const double testRatio{ config.getDouble("test-ratio", 0.2) };
            const auto seed{ static_cast<std::uint_fast32_t>(config.getULong("seed", 42)) };

            REKIT_LOG(MAIN, INFO, "Splitting " << table.getRowCount() << " rows using '" << splitMode << "' mode");

            if (splitMode == "random")
            {
                dataset::RandomSplitParameters params;
                params.ratios = { 1 - testRatio, testRatio };
                params.seed = seed;
                params.filterUnknown = config.getBool("filter-unknown", false);

                std::vector<dataset::RawTable> tables{ dataset::splitRandom(table, schema, params) };
                return { std::move(tables[0]), std::move(tables[1]) };
            }
            if (splitMode == "chrono")
                return dataset::splitChrono(table, schema, dataset::ChronoSplitParameters{ .testRatio = testRatio, .perUser = config.getBool("per-user", false) });
            if (splitMode == "count")
                return dataset::splitByCount(table, schema, config.getULong("test-count", 1), seed);

            throw core::RekitException{ "Unknown split mode '" + std::string{ splitMode } + "', expected 'random', 'chrono' or 'count'" };
        }

        std::unique_ptr<recommendation::IScoreModel> createModel(core::IConfig& config, const dataset::DatasetInfo& datasetInfo)
        {
            const std::string_view modelName{ config.getString("model", "usercf") };
            if (modelName == "usercf")
                return recommendation::createUserCFModel(datasetInfo, recommendation::UserCFParameters{ .neighborCount = config.getULong("usercf-neighbors", 20) });
            if (modelName == "popular")
                return recommendation::createPopularityModel(datasetInfo);

            throw core::RekitException{ "Unknown model '" + std::string{ modelName } + "', expected 'usercf' or 'popular'" };
        }

        dataset::RecordSet sampleNegatives(core::IConfig& config, const dataset::DatasetInfo& datasetInfo, const dataset::RecordSet& records, std::string_view samplerSetting, std::string_view defaultSampler)
        {
            const std::string_view distribution{ config.getString(samplerSetting, defaultSampler) };

            dataset::SamplingParameters params;
            params.negativesPerPositive = config.getULong("num-neg", 1);
            params.maxRetries = config.getULong("sampler-max-retries", 10);
            params.seed = static_cast<std::uint_fast32_t>(config.getULong("seed", 42));
            if (const std::optional<dataset::SamplingDistribution> parsed{ dataset::parseSamplingDistribution(distribution) })
                params.distribution = *parsed;
            else
                throw core::RekitException{ "Unknown sampler '" + std::string{ distribution } + "', expected 'uniform', 'unconsumed' or 'popular'" };

            dataset::NegativeSampler sampler{ datasetInfo, params };
            dataset::RecordSet res{ sampler.sample(records) };

            const dataset::SamplingStats& stats{ sampler.getStats() };
            REKIT_LOG_IF(MAIN, WARNING, stats.fallbackCount > 0, stats.fallbackCount << " negatives may collide with positives");

            return res;
        }

        std::vector<recommendation::Metric> getMetrics(core::IConfig& config, dataset::Task task)
        {
            std::vector<recommendation::Metric> metrics;
            if (task == dataset::Task::Rating)
                config.visitStrings("metrics", [&](std::string_view name) { metrics.push_back(recommendation::parseMetric(name)); }, { "rmse", "mae" });
            else
                config.visitStrings("metrics", [&](std::string_view name) { metrics.push_back(recommendation::parseMetric(name)); }, { "roc_auc", "precision", "recall", "ndcg" });

            return metrics;
        }

        void dumpRecommendations(const recommendation::IRecommender& recommender, const std::vector<std::string>& users, std::size_t maxCount, recommendation::ColdStartPolicy policy)
        {
            for (const std::string& user : users)
            {
                const bool knownUser{ recommender.getDatasetInfo().getRegistry().contains(dataset::EntityType::User, user) };
                std::cout << "Recommendations for " << (knownUser ? "user '" : "unknown user '") << user << "':" << std::endl;
                for (const recommendation::Recommendation& recommendation : recommender.recommendUser(user, maxCount, policy))
                    std::cout << "\t- '" << recommendation.itemId << "', score = " << recommendation.score << std::endl;
            }
        }

        void dumpPredictions(const recommendation::IRecommender& recommender, const std::vector<std::string>& users, const std::vector<std::string>& items, recommendation::ColdStartPolicy policy)
        {
            for (const std::string& user : users)
            {
                for (const std::string& item : items)
                {
                    std::cout << "Prediction for user '" << user << "', item '" << item << "' (" << recommendation::getQueryResolutionName(recommender.resolve(user, item)) << "): "
                              << recommender.predict(user, item, policy) << std::endl;
                }
            }
        }
    } // namespace
} // namespace rekit

int main(int argc, char* argv[])
{
    try
    {
        using namespace rekit;
        namespace po = boost::program_options;

        po::options_description desc{ "Allowed options" };
        desc.add_options()("help,h", "print usage message")("conf,c", po::value<std::string>()->default_value("/etc/rekit.conf"), "Rekit config file")("input,i", po::value<std::string>(), "Interaction file")("test,t", po::value<std::string>(), "Test interaction file, the input file is split if not set")("user,u", po::value<std::vector<std::string>>()->multitoken(), "Users to recommend items to")("item", po::value<std::vector<std::string>>()->multitoken(), "Items to predict for the given users")("n-rec,n", po::value<std::size_t>(), "Recommendation count")("cold-start", po::value<std::string>(), "Cold start policy: average, popular or fail");

        po::variables_map vm;
        po::store(po::parse_command_line(argc, argv, desc), vm);

        if (vm.count("help") || !vm.count("input"))
        {
            std::cout << desc << std::endl;
            return vm.count("help") ? EXIT_SUCCESS : EXIT_FAILURE;
        }

        core::Service<core::IConfig> config{ core::createConfig(vm["conf"].as<std::string>()) };

        const std::string_view severityStr{ config->getString("log-min-severity", "info") };
        const std::optional<core::logging::Severity> minSeverity{ core::logging::parseSeverity(severityStr) };
        if (!minSeverity)
            throw core::RekitException{ "Invalid log-min-severity '" + std::string{ severityStr } + "'" };
        core::Service<core::logging::ILogger> logger{ core::logging::createLogger(*minSeverity, config->getPath("log-file", "")) };

        const std::string_view taskStr{ config->getString("task", "rating") };
        const std::optional<dataset::Task> task{ dataset::parseTask(taskStr) };
        if (!task)
            throw core::RekitException{ "Invalid task '" + std::string{ taskStr } + "', expected 'rating' or 'ranking'" };

        const dataset::Schema schema{ createSchema(*config) };
        const dataset::ReadParameters readParams{ .delimiter = getChar(*config, "delimiter", ","), .hasHeader = config->getBool("has-header", true) };

        const dataset::RawTable table{ dataset::readTable(std::filesystem::path{ vm["input"].as<std::string>() }, readParams) };
        auto [trainTable, testTable]{ vm.count("test") ? std::make_pair(table, dataset::readTable(std::filesystem::path{ vm["test"].as<std::string>() }, readParams))
                                                       : splitTable(*config, table, schema) };

        dataset::TableBuilder builder{ schema, *task };
        dataset::RecordSet trainSet{ builder.buildTrainSet(trainTable) };
        dataset::RecordSet testSet{ builder.buildTestSet(testTable) };
        const dataset::DatasetInfo& datasetInfo{ builder.getDatasetInfo() };

        std::cout << datasetInfo << std::endl;

        if (*task == dataset::Task::Ranking && config->getULong("num-neg", 1) > 0)
        {
            trainSet = sampleNegatives(*config, datasetInfo, trainSet, "sampler", "uniform");
            testSet = sampleNegatives(*config, datasetInfo, testSet, "test-sampler", "unconsumed");
        }

        const std::unique_ptr<recommendation::IScoreModel> model{ createModel(*config, datasetInfo) };
        REKIT_LOG(MAIN, INFO, "Fitting model '" << model->getName() << "' on " << trainSet.size() << " records");
        model->fit(trainSet);

        const std::unique_ptr<recommendation::IRecommender> recommender{ recommendation::createRecommender(datasetInfo, *model) };

        const recommendation::ColdStartPolicy coldStart{ recommendation::parseColdStartPolicy(vm.count("cold-start") ? vm["cold-start"].as<std::string>() : std::string{ config->getString("cold-start", "average") }) };

        if (!testSet.empty())
        {
            recommendation::EvaluationParameters evalParams;
            evalParams.k = config->getULong("eval-k", 10);
            evalParams.batchSize = config->getULong("eval-batch-size", 8192);
            evalParams.coldStart = coldStart;
            evalParams.filterConsumed = config->getBool("filter-consumed", true);

            const std::vector<recommendation::Metric> metrics{ getMetrics(*config, *task) };
            std::cout << "Evaluation on " << testSet.size() << " records:" << std::endl;
            for (const auto& [metric, value] : recommendation::evaluate(*recommender, testSet, metrics, evalParams))
                std::cout << "\t" << recommendation::getMetricName(metric) << ": " << value << std::endl;
        }

        if (vm.count("user"))
        {
            const std::vector<std::string>& users{ vm["user"].as<std::vector<std::string>>() };
            if (vm.count("item"))
                dumpPredictions(*recommender, users, vm["item"].as<std::vector<std::string>>(), coldStart);
            else
                dumpRecommendations(*recommender, users, vm.count("n-rec") ? vm["n-rec"].as<std::size_t>() : config->getULong("n-rec", 10), coldStart);
        }
    }
    catch (std::exception& e)
    {
        std::cerr << "Caught exception: " << e.what() << std::endl;
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
