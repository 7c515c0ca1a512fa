/*
 * SPDX-FileCopyrightText: Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 * SPDX-License-Identifier: MIT
 *
 * Bookbinder Cli Tests
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

#include <initializer_list>
#include <stdexcept>
#include <vector>

#include <Bookbinder/Cli/CommandLine.hpp>
#include <Bookbinder/Config/AppConfig.hpp>

using namespace Bookbinder;
using namespace Bookbinder::Cli;

namespace {

CommandLine parse(std::initializer_list<const char *> args)
{
	const std::vector<const char *> argv(args);
	return parseCommandLine(argv);
}

} // anonymous namespace

TEST(CommandLineTest, PositionalArgumentIsPageUrl)
{
	const CommandLine commandLine = parse({"https://example.com/book.html"});

	EXPECT_EQ(commandLine.mode, RunMode::Page);
	EXPECT_EQ(commandLine.input, "https://example.com/book.html");
	EXPECT_FALSE(commandLine.dryRun);
	EXPECT_EQ(commandLine.configPath, "bookbinder.json");
}

TEST(CommandLineTest, SelectsModeFromInputOption)
{
	EXPECT_EQ(parse({"--url-list", "urls.txt"}).mode, RunMode::UrlList);
	EXPECT_EQ(parse({"--combine-only", "temp_dune"}).mode, RunMode::CombineOnly);
	EXPECT_EQ(parse({"--analyze", "temp_dune"}).input, "temp_dune");
}

TEST(CommandLineTest, ParsesOptionValues)
{
	const CommandLine commandLine = parse({"--url-list", "urls.txt", "--dry-run", "--title", "Dune", "--max-duration",
					       "45.5", "--max-size", "120", "--bitrate", "96", "--concurrency", "4",
					       "--no-upload", "--config", "alt.json"});

	EXPECT_TRUE(commandLine.dryRun);
	EXPECT_TRUE(commandLine.noUpload);
	EXPECT_EQ(commandLine.title, "Dune");
	EXPECT_EQ(commandLine.maxDurationMinutes, 45.5);
	EXPECT_EQ(commandLine.maxSizeMb, 120.0);
	EXPECT_EQ(commandLine.bitrateKbps, 96);
	EXPECT_EQ(commandLine.fetchConcurrency, 4);
	EXPECT_EQ(commandLine.configPath, "alt.json");
	EXPECT_FALSE(commandLine.retryCount.has_value());
}

TEST(CommandLineTest, HelpWinsOverEverythingElse)
{
	EXPECT_EQ(parse({"--help"}).mode, RunMode::Help);
	EXPECT_EQ(parse({"https://example.com", "-h"}).mode, RunMode::Help);
}

TEST(CommandLineTest, RejectsInvalidInvocations)
{
	EXPECT_THROW(parse({}), std::invalid_argument);
	EXPECT_THROW(parse({"--frobnicate"}), std::invalid_argument);
	EXPECT_THROW(parse({"https://example.com", "--bitrate"}), std::invalid_argument);
	EXPECT_THROW(parse({"https://example.com", "--bitrate", "fast"}), std::invalid_argument);
	EXPECT_THROW(parse({"https://example.com", "--retries", "3x"}), std::invalid_argument);
	EXPECT_THROW(parse({"https://example.com", "--url-list", "urls.txt"}), std::invalid_argument);
	EXPECT_THROW(parse({"--combine-only", "temp_dune", "--dry-run"}), std::invalid_argument);
}

TEST(CommandLineTest, ErrorMessageNamesTheOption)
{
	try {
		parse({"https://example.com", "--max-size", "big"});
		FAIL() << "malformed number accepted";
	} catch (const std::invalid_argument &e) {
		EXPECT_STREQ(e.what(), "InvalidNumberError(parseCommandLine):--max-size=big");
	}
}

TEST(CommandLineTest, OverridesOnlyGivenOptions)
{
	Config::AppConfig config;
	config.outputDirectory = "/srv/books";
	const CommandLine commandLine = parse({"https://example.com", "--retries", "5", "--token", "/etc/token.json"});

	applyOverrides(commandLine, config);

	EXPECT_EQ(config.retryCount, 5);
	EXPECT_EQ(config.tokenPath, "/etc/token.json");
	EXPECT_EQ(config.outputDirectory, "/srv/books");
	EXPECT_EQ(config.bitrateKbps, 128);
}

TEST(CommandLineTest, UsageMentionsProgramName)
{
	EXPECT_NE(usageText("bookbinder").find("Usage: bookbinder"), std::string::npos);
}
