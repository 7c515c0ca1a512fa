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

#include "CommandLine.hpp"

#include <charconv>
#include <stdexcept>
#include <system_error>

#include <fmt/format.h>

namespace Bookbinder::Cli {

namespace {

int parseInt(std::string_view option, std::string_view value)
{
	int result = 0;
	const auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), result);
	if (ec != std::errc() || ptr != value.data() + value.size()) {
		throw std::invalid_argument(fmt::format("InvalidNumberError(parseCommandLine):{}={}", option, value));
	}
	return result;
}

double parseDouble(std::string_view option, std::string_view value)
{
	double result = 0.0;
	const auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), result);
	if (ec != std::errc() || ptr != value.data() + value.size()) {
		throw std::invalid_argument(fmt::format("InvalidNumberError(parseCommandLine):{}={}", option, value));
	}
	return result;
}

void setInput(CommandLine &commandLine, RunMode mode, std::string_view input)
{
	if (commandLine.mode != RunMode::Help) {
		throw std::invalid_argument(fmt::format("ConflictingInputError(parseCommandLine):{}", input));
	}
	commandLine.mode = mode;
	commandLine.input = std::string(input);
}

} // anonymous namespace

CommandLine parseCommandLine(std::span<const char *const> args)
{
	CommandLine commandLine;
	bool helpRequested = false;

	for (std::size_t i = 0; i < args.size(); ++i) {
		const std::string_view arg = args[i];

		auto value = [&]() -> std::string_view {
			if (i + 1 >= args.size()) {
				throw std::invalid_argument(fmt::format("MissingOptionValueError(parseCommandLine):{}", arg));
			}
			return args[++i];
		};

		if (arg == "--help" || arg == "-h") {
			helpRequested = true;
		} else if (arg == "--url-list") {
			setInput(commandLine, RunMode::UrlList, value());
		} else if (arg == "--combine-only") {
			setInput(commandLine, RunMode::CombineOnly, value());
		} else if (arg == "--analyze") {
			setInput(commandLine, RunMode::Analyze, value());
		} else if (arg == "--dry-run") {
			commandLine.dryRun = true;
		} else if (arg == "--no-upload") {
			commandLine.noUpload = true;
		} else if (arg == "--title") {
			commandLine.title = std::string(value());
		} else if (arg == "--config") {
			commandLine.configPath = std::string(value());
		} else if (arg == "--output") {
			commandLine.outputDirectory = std::string(value());
		} else if (arg == "--max-duration") {
			commandLine.maxDurationMinutes = parseDouble(arg, value());
		} else if (arg == "--max-size") {
			commandLine.maxSizeMb = parseDouble(arg, value());
		} else if (arg == "--bitrate") {
			commandLine.bitrateKbps = parseInt(arg, value());
		} else if (arg == "--retries") {
			commandLine.retryCount = parseInt(arg, value());
		} else if (arg == "--retry-delay") {
			commandLine.retryDelaySeconds = parseInt(arg, value());
		} else if (arg == "--concurrency") {
			commandLine.fetchConcurrency = parseInt(arg, value());
		} else if (arg == "--client-secret") {
			commandLine.clientSecretPath = std::string(value());
		} else if (arg == "--token") {
			commandLine.tokenPath = std::string(value());
		} else if (arg.starts_with("-")) {
			throw std::invalid_argument(fmt::format("UnknownOptionError(parseCommandLine):{}", arg));
		} else {
			setInput(commandLine, RunMode::Page, arg);
		}
	}

	if (helpRequested) {
		commandLine.mode = RunMode::Help;
		return commandLine;
	}

	if (commandLine.mode == RunMode::Help) {
		throw std::invalid_argument("InputMissingError(parseCommandLine)");
	}

	if (commandLine.dryRun && (commandLine.mode == RunMode::CombineOnly || commandLine.mode == RunMode::Analyze)) {
		throw std::invalid_argument("DryRunNotApplicableError(parseCommandLine)");
	}

	return commandLine;
}

void applyOverrides(const CommandLine &commandLine, Config::AppConfig &config)
{
	if (commandLine.outputDirectory)
		config.outputDirectory = *commandLine.outputDirectory;
	if (commandLine.maxDurationMinutes)
		config.maxDurationMinutes = *commandLine.maxDurationMinutes;
	if (commandLine.maxSizeMb)
		config.maxSizeMb = *commandLine.maxSizeMb;
	if (commandLine.bitrateKbps)
		config.bitrateKbps = *commandLine.bitrateKbps;
	if (commandLine.retryCount)
		config.retryCount = *commandLine.retryCount;
	if (commandLine.retryDelaySeconds)
		config.retryDelaySeconds = *commandLine.retryDelaySeconds;
	if (commandLine.fetchConcurrency)
		config.fetchConcurrency = *commandLine.fetchConcurrency;
	if (commandLine.clientSecretPath)
		config.clientSecretPath = *commandLine.clientSecretPath;
	if (commandLine.tokenPath)
		config.tokenPath = *commandLine.tokenPath;
}

std::string usageText(std::string_view program)
{
	return fmt::format(R"(Usage: {} [options] <page-url>

Inputs (exactly one):
  <page-url>             discover chunk URLs from the <audio> elements of a web page
  --url-list <file>      read chunk URLs from a file, one per line
  --combine-only <dir>   pack existing audio_NN.<ext> files from <dir> without downloading
  --analyze <dir>        sample the first chunks in <dir> and report whether packing is needed

Options:
  --dry-run              discover only and list what would be fetched
  --no-upload            skip publishing to Google Drive
  --title <title>        override the derived book title
  --config <file>        JSON configuration file (default: bookbinder.json)
  --output <dir>         output directory
  --max-duration <min>   segment duration bound in minutes
  --max-size <mb>        segment decoded size bound in MiB
  --bitrate <kbps>       export bitrate
  --retries <n>          attempts per chunk
  --retry-delay <sec>    delay between attempts
  --concurrency <n>      parallel chunk downloads
  --client-secret <file> Google OAuth client secret
  --token <file>         Google OAuth token file
  --help                 show this message
)",
			   program);
}

} // namespace Bookbinder::Cli
