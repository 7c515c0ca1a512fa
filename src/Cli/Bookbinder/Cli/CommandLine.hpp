/*
 * SPDX-FileCopyrightText: Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 * SPDX-License-Identifier: MIT
 *
 * Bookbinder Cli Library
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

#pragma once

#include <optional>
#include <span>
#include <string>
#include <string_view>

#include <Bookbinder/Config/AppConfig.hpp>

namespace Bookbinder::Cli {

enum class RunMode { Help, Page, UrlList, CombineOnly, Analyze };

struct CommandLine {
	RunMode mode = RunMode::Help;
	/// Page URL, URL list file or chunk directory, depending on the mode.
	std::string input;

	bool dryRun = false;
	bool noUpload = false;
	std::optional<std::string> title;
	std::string configPath = "bookbinder.json";

	std::optional<std::string> outputDirectory;
	std::optional<double> maxDurationMinutes;
	std::optional<double> maxSizeMb;
	std::optional<int> bitrateKbps;
	std::optional<int> retryCount;
	std::optional<int> retryDelaySeconds;
	std::optional<int> fetchConcurrency;
	std::optional<std::string> clientSecretPath;
	std::optional<std::string> tokenPath;
};

/**
 * Parses the arguments after the program name. Throws std::invalid_argument
 * for an unknown option, a missing or malformed value, or a missing or
 * conflicting input.
 */
CommandLine parseCommandLine(std::span<const char *const> args);

/// Copies every option given on the command line into `config`.
void applyOverrides(const CommandLine &commandLine, Config::AppConfig &config);

std::string usageText(std::string_view program);

} // namespace Bookbinder::Cli
