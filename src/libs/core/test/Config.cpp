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

#include <filesystem>
#include <fstream>
#include <vector>

#include <gtest/gtest.h>

#include "core/Exception.hpp"
#include "core/IConfig.hpp"

namespace rekit::core::tests
{
    namespace
    {
        class ScopedConfigFile
        {
        public:
            ScopedConfigFile(std::string_view content)
                : _path{ std::filesystem::temp_directory_path() / ("rekit-config-test-" + std::to_string(::testing::UnitTest::GetInstance()->random_seed()) + ".conf") }
            {
                std::ofstream file{ _path };
                file << content;
            }
            ~ScopedConfigFile()
            {
                std::error_code ec;
                std::filesystem::remove(_path, ec);
            }
            ScopedConfigFile(const ScopedConfigFile&) = delete;
            ScopedConfigFile& operator=(const ScopedConfigFile&) = delete;

            const std::filesystem::path& getPath() const { return _path; }

        private:
            const std::filesystem::path _path;
        };
    } // namespace

    TEST(Config, values)
    {
        const ScopedConfigFile file{ R"(
task = "ranking";
num-neg = 3;
test-ratio = 0.25;
has-header = true;
sparse-columns = ["sex", "occupation"];
)" };

        auto config{ createConfig(file.getPath()) };

        EXPECT_EQ(config->getString("task", "rating"), "ranking");
        EXPECT_EQ(config->getString("missing", "rating"), "rating");
        EXPECT_EQ(config->getULong("num-neg", 1), 3UL);
        EXPECT_DOUBLE_EQ(config->getDouble("test-ratio", 0.1), 0.25);
        EXPECT_DOUBLE_EQ(config->getDouble("eval-ratio", 0.1), 0.1);
        EXPECT_TRUE(config->getBool("has-header", false));
        EXPECT_EQ(config->getPath("log-file", "/tmp/foo.log"), std::filesystem::path{ "/tmp/foo.log" });

        std::vector<std::string> columns;
        config->visitStrings("sparse-columns", [&](std::string_view column) { columns.emplace_back(column); }, {});
        EXPECT_EQ(columns, (std::vector<std::string>{ "sex", "occupation" }));

        columns.clear();
        config->visitStrings("dense-columns", [&](std::string_view column) { columns.emplace_back(column); }, { "age" });
        EXPECT_EQ(columns, (std::vector<std::string>{ "age" }));
    }

    TEST(Config, parseError)
    {
        const ScopedConfigFile file{ "task = ;" };
        EXPECT_THROW(createConfig(file.getPath()), RekitException);
    }

    TEST(Config, missingFile)
    {
        EXPECT_THROW(createConfig("/this/path/does/not/exist.conf"), RekitException);
    }
} // namespace rekit::core::tests
