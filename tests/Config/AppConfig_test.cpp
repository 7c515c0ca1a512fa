/*
 * SPDX-FileCopyrightText: Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 * SPDX-License-Identifier: MIT
 *
 * Bookbinder Config Tests
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in all
 * copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
 * SOFTWARE.
 */

#include <gtest/gtest.h>

#include <stdexcept>

#include <nlohmann/json.hpp>

#include <Bookbinder/Config/AppConfig.hpp>
#include <Bookbinder/Logger/NullLogger.hpp>

#include <TestSupport/TemporaryDirectory.hpp>

using namespace Bookbinder;
using namespace Bookbinder::Config;

TEST(AppConfigTest, MissingFileYieldsDefaults)
{
	TestSupport::TemporaryDirectory tempDir;

	const AppConfig config = AppConfig::load(tempDir.path / "bookbinder.json", Logger::NullLogger::instance());

	EXPECT_DOUBLE_EQ(config.maxDurationMinutes, 60.0);
	EXPECT_DOUBLE_EQ(config.maxSizeMb, 150.0);
	EXPECT_EQ(config.bitrateKbps, 128);
	EXPECT_EQ(config.audioExtension, "mp3");
	EXPECT_EQ(config.retryCount, 3);
	EXPECT_EQ(config.driveRootFolderName, "audiobooks");
	EXPECT_FALSE(config.keepChunks);
	EXPECT_NO_THROW(config.validate());
}

TEST(AppConfigTest, FileOverridesOnlyPresentKeys)
{
	TestSupport::TemporaryDirectory tempDir;
	const auto path = tempDir.write("bookbinder.json", R"({
		"maxDurationMinutes": 45,
		"audioExtension": "m4a",
		"keepChunks": true,
		"somethingElse": 1
	})");

	const AppConfig config = AppConfig::load(path, Logger::NullLogger::instance());

	EXPECT_DOUBLE_EQ(config.maxDurationMinutes, 45.0);
	EXPECT_EQ(config.audioExtension, "m4a");
	EXPECT_TRUE(config.keepChunks);
	EXPECT_DOUBLE_EQ(config.maxSizeMb, 150.0);
	EXPECT_EQ(config.tokenPath, "token.json");
}

TEST(AppConfigTest, MalformedOrMistypedFileThrows)
{
	TestSupport::TemporaryDirectory tempDir;
	const auto broken = tempDir.write("broken.json", "{ \"maxSizeMb\": ");
	const auto mistyped = tempDir.write("mistyped.json", R"({"retryCount": "three"})");
	const auto notObject = tempDir.write("array.json", "[1, 2]");

	EXPECT_THROW(AppConfig::load(broken, Logger::NullLogger::instance()), std::runtime_error);
	EXPECT_THROW(AppConfig::load(mistyped, Logger::NullLogger::instance()), std::runtime_error);
	EXPECT_THROW(AppConfig::load(notObject, Logger::NullLogger::instance()), std::runtime_error);
}

TEST(AppConfigTest, ValidateNamesOffendingKey)
{
	AppConfig config;
	config.maxSizeMb = 0.0;

	try {
		config.validate();
		FAIL() << "validate() accepted a zero size limit";
	} catch (const std::runtime_error &e) {
		EXPECT_STREQ(e.what(), "ConfigValueError(AppConfig::validate):maxSizeMb");
	}
}

TEST(AppConfigTest, ValidateRejectsNonPositiveLimits)
{
	AppConfig negativeDuration;
	negativeDuration.maxDurationMinutes = -1.0;
	AppConfig noRetries;
	noRetries.retryCount = 0;
	AppConfig noWorkers;
	noWorkers.fetchConcurrency = 0;

	EXPECT_THROW(negativeDuration.validate(), std::runtime_error);
	EXPECT_THROW(noRetries.validate(), std::runtime_error);
	EXPECT_THROW(noWorkers.validate(), std::runtime_error);
}

TEST(AppConfigTest, JsonRoundTripKeepsAllKeys)
{
	AppConfig config;
	config.urlHostFilter = "cdn.example.com";
	config.fetchConcurrency = 4;

	const nlohmann::json j = config;
	const auto restored = j.get<AppConfig>();

	EXPECT_EQ(j.size(), 16u);
	EXPECT_EQ(restored.urlHostFilter, "cdn.example.com");
	EXPECT_EQ(restored.fetchConcurrency, 4);
}
