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

#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "core/Exception.hpp"
#include "core/ILogger.hpp"
#include "core/Service.hpp"

namespace rekit::core::tests
{
    namespace
    {
        struct LoggedMessage
        {
            logging::Module module;
            logging::Severity severity;
            std::string message;
        };

        class RecordingLogger : public logging::ILogger
        {
        public:
            RecordingLogger(logging::Severity minSeverity, std::vector<LoggedMessage>& messages)
                : _minSeverity{ minSeverity }
                , _messages{ messages }
            {
            }

        private:
            bool isSeverityActive(logging::Severity severity) const override { return severity <= _minSeverity; }
            void processLog(const logging::Log& log) override { processLog(log.getModule(), log.getSeverity(), log.getMessage()); }
            void processLog(logging::Module module, logging::Severity severity, std::string_view message) override
            {
                _messages.push_back(LoggedMessage{ module, severity, std::string{ message } });
            }

            const logging::Severity _minSeverity;
            std::vector<LoggedMessage>& _messages;
        };

        std::size_t countEvaluations(std::size_t& counter)
        {
            return ++counter;
        }
    } // namespace

    TEST(Service, noLoggerRegistered)
    {
        EXPECT_FALSE(Service<logging::ILogger>::exists());

        // message is not even evaluated
        std::size_t counter{};
        REKIT_LOG(DATASET, INFO, "count = " << countEvaluations(counter));
        REKIT_LOG_IF(SAMPLER, WARNING, true, "count = " << countEvaluations(counter));
        EXPECT_EQ(counter, 0);
    }

    TEST(Service, loggerRegistration)
    {
        std::vector<LoggedMessage> messages;
        {
            Service<logging::ILogger> logger{ std::make_unique<RecordingLogger>(logging::Severity::INFO, messages) };
            EXPECT_TRUE(Service<logging::ILogger>::exists());
            EXPECT_EQ(Service<logging::ILogger>::get(), logger.get());
            EXPECT_THROW(Service<logging::ILogger>{ std::make_unique<RecordingLogger>(logging::Severity::DEBUG, messages) }, RekitException);

            std::size_t counter{};
            REKIT_LOG(DATASET, INFO, "built " << 3 << " records");
            REKIT_LOG(ENCODER, DEBUG, "count = " << countEvaluations(counter));
            REKIT_LOG_IF(SAMPLER, WARNING, false, "count = " << countEvaluations(counter));
            REKIT_LOG_IF(SAMPLER, WARNING, true, 2 << " fallbacks");
            EXPECT_EQ(counter, 0);
        }

        // unregistered when the service goes out of scope
        EXPECT_FALSE(Service<logging::ILogger>::exists());
        REKIT_LOG(MAIN, ERROR, "lost");

        ASSERT_EQ(messages.size(), 2);
        EXPECT_EQ(messages[0].module, logging::Module::DATASET);
        EXPECT_EQ(messages[0].severity, logging::Severity::INFO);
        EXPECT_EQ(messages[0].message, "built 3 records");
        EXPECT_EQ(messages[1].module, logging::Module::SAMPLER);
        EXPECT_EQ(messages[1].severity, logging::Severity::WARNING);
        EXPECT_EQ(messages[1].message, "2 fallbacks");
    }

    TEST(Service, parseSeverity)
    {
        EXPECT_EQ(logging::parseSeverity("debug"), logging::Severity::DEBUG);
        EXPECT_EQ(logging::parseSeverity("WARNING"), logging::Severity::WARNING);
        EXPECT_EQ(logging::parseSeverity("verbose"), std::nullopt);
    }
} // namespace rekit::core::tests
