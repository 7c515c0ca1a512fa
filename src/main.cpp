/*
 * SPDX-FileCopyrightText: Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 * SPDX-License-Identifier: MIT
 *
 * Bookbinder Application
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

#include <chrono>
#include <cstdio>
#include <exception>
#include <filesystem>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <curl/curl.h>
#include <fmt/format.h>

#include <Bookbinder/AudioCodec/FFmpegAudioCodec.hpp>
#include <Bookbinder/Cli/CommandLine.hpp>
#include <Bookbinder/Config/AppConfig.hpp>
#include <Bookbinder/CurlHelper/CurlHandle.hpp>
#include <Bookbinder/Discovery/PageDiscovery.hpp>
#include <Bookbinder/GoogleAuth/GoogleAuthManager.hpp>
#include <Bookbinder/GoogleAuth/GoogleOAuth2ClientCredentials.hpp>
#include <Bookbinder/GoogleAuth/GoogleTokenStorage.hpp>
#include <Bookbinder/GoogleDriveApi/GoogleDriveApiClient.hpp>
#include <Bookbinder/Logger/FileLogger.hpp>
#include <Bookbinder/Logger/MultiLogger.hpp>
#include <Bookbinder/Logger/PrintLogger.hpp>
#include <Bookbinder/Pipeline/ChunkAcquirer.hpp>
#include <Bookbinder/Pipeline/ChunkAnalyzer.hpp>
#include <Bookbinder/Pipeline/CurlChunkFetcher.hpp>
#include <Bookbinder/Pipeline/GoogleDriveStorageClient.hpp>
#include <Bookbinder/Pipeline/LocalChunks.hpp>
#include <Bookbinder/Pipeline/PipelineErrors.hpp>
#include <Bookbinder/Pipeline/PipelineRunner.hpp>

using namespace Bookbinder;

namespace {

constexpr int kExitSuccess = 0;
constexpr int kExitFailure = 1;
constexpr int kExitUsage = 2;

class CurlGlobalGuard {
public:
	CurlGlobalGuard()
	{
		if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
			throw std::runtime_error("CurlGlobalInitError(CurlGlobalGuard::CurlGlobalGuard)");
		}
	}
	~CurlGlobalGuard() noexcept { curl_global_cleanup(); }

	CurlGlobalGuard(const CurlGlobalGuard &) = delete;
	CurlGlobalGuard &operator=(const CurlGlobalGuard &) = delete;
};

std::shared_ptr<const Logger::ILogger> makeLogger(const Config::AppConfig &config)
{
	std::shared_ptr<const Logger::ILogger> printLogger = Logger::PrintLogger::instance();
	if (config.logFilePath.empty()) {
		return printLogger;
	}

	try {
		auto fileLogger = std::make_shared<const Logger::FileLogger>(config.logFilePath);
		return std::make_shared<const Logger::MultiLogger>(
			std::vector<std::shared_ptr<const Logger::ILogger>>{printLogger, fileLogger});
	} catch (const std::runtime_error &e) {
		printLogger->warn("LogFileUnavailable", {{"path", config.logFilePath}, {"what", e.what()}});
		return printLogger;
	}
}

std::shared_ptr<Pipeline::IStorageClient> makeDriveStorage(const Config::AppConfig &config,
							   const std::shared_ptr<const Logger::ILogger> &logger)
{
	auto credentials = GoogleAuth::loadClientCredentialsFile(config.clientSecretPath);
	auto authManager = std::make_shared<const GoogleAuth::GoogleAuthManager>(
		std::make_shared<CurlHelper::CurlHandle>(), std::move(credentials), logger);
	auto tokenStorage = std::make_shared<const GoogleAuth::GoogleTokenStorage>(config.tokenPath, logger);
	auto apiClient =
		std::make_shared<GoogleDriveApi::GoogleDriveApiClient>(std::make_shared<CurlHelper::CurlHandle>(), logger);

	return std::make_shared<Pipeline::GoogleDriveStorageClient>(std::move(apiClient), std::move(authManager),
								    std::move(tokenStorage), logger);
}

Pipeline::PackerOptions makePackerOptions(const Config::AppConfig &config)
{
	Pipeline::PackerOptions options;
	options.maxDurationMinutes = config.maxDurationMinutes;
	options.maxSizeMb = config.maxSizeMb;
	options.bitrateKbps = config.bitrateKbps;
	options.extension = config.audioExtension;
	options.outputDirectory = config.outputDirectory;
	return options;
}

Pipeline::RunnerOptions makeRunnerOptions(const Cli::CommandLine &commandLine, const Config::AppConfig &config)
{
	Pipeline::RunnerOptions options;
	options.outputDirectory = config.outputDirectory;
	options.driveRootFolderName = config.driveRootFolderName;
	options.keepChunks = config.keepChunks;
	options.titleOverride = commandLine.title;
	return options;
}

int runAnalyze(const Cli::CommandLine &commandLine, const Config::AppConfig &config,
	       const std::shared_ptr<const Logger::ILogger> &logger)
{
	const std::vector<Pipeline::Chunk> chunks =
		Pipeline::scanChunkDirectory(commandLine.input, config.audioExtension, logger);
	if (chunks.empty()) {
		logger->error("NoLocalChunks", {{"directory", commandLine.input}});
		return kExitFailure;
	}

	auto codec = std::make_shared<const AudioCodec::FFmpegAudioCodec>(config.ffmpegPath, config.ffprobePath, logger);
	const Pipeline::ChunkAnalyzer analyzer(codec, config.maxDurationMinutes, config.maxSizeMb, logger);

	try {
		const Pipeline::ChunkAnalysis analysis = analyzer.analyze(chunks);
		fmt::print("Chunks found: {}\n", chunks.size());
		fmt::print("Chunks sampled: {}\n", analysis.sampledChunks);
		fmt::print("Average duration: {:.1f} min\n", analysis.averageDurationMinutes);
		fmt::print("Average size: {:.1f} MB\n", analysis.averageSizeMb);
		fmt::print("Packing recommended: {}\n", analysis.packingRecommended ? "yes" : "no");
	} catch (const Pipeline::DecodeError &e) {
		logger->error("AnalysisFailed", {{"what", e.what()}});
		return kExitFailure;
	}
	return kExitSuccess;
}

Discovery::DiscoveryResult discover(const Cli::CommandLine &commandLine, const Config::AppConfig &config,
				    const std::shared_ptr<const Logger::ILogger> &logger)
{
	if (commandLine.mode == Cli::RunMode::UrlList) {
		Discovery::DiscoveryResult result = Discovery::makeDiscoveryResult(Discovery::readUrlList(commandLine.input));
		logger->info("UrlListLoaded", {{"path", commandLine.input}, {"urls", std::to_string(result.urls.size())}});
		return result;
	}

	const Discovery::PageDiscovery pageDiscovery(std::make_shared<CurlHelper::CurlHandle>(), logger,
						     config.urlHostFilter);
	return pageDiscovery.discover(commandLine.input);
}

int runDryRun(const Discovery::DiscoveryResult &discovery, const Cli::CommandLine &commandLine,
	      const Config::AppConfig &config)
{
	fmt::print("Title: {}\n", commandLine.title.value_or(discovery.title));
	fmt::print("Chunks: {}\n", discovery.urls.size());
	for (std::size_t i = 0; i < discovery.urls.size(); ++i) {
		fmt::print("  {} <- {}\n", Pipeline::chunkFileName(static_cast<int>(i + 1), config.audioExtension),
			   discovery.urls[i]);
	}
	return discovery.urls.empty() ? kExitFailure : kExitSuccess;
}

int runPipeline(const Cli::CommandLine &commandLine, const Config::AppConfig &config,
		const std::shared_ptr<const Logger::ILogger> &logger)
{
	std::optional<Discovery::DiscoveryResult> discovery;
	if (commandLine.mode == Cli::RunMode::Page || commandLine.mode == Cli::RunMode::UrlList) {
		discovery = discover(commandLine, config, logger);
		if (commandLine.dryRun) {
			return runDryRun(*discovery, commandLine, config);
		}
	}

	std::shared_ptr<Pipeline::IStorageClient> storage;
	if (!commandLine.noUpload) {
		storage = makeDriveStorage(config, logger);
	}

	Pipeline::AcquirerOptions acquirerOptions;
	acquirerOptions.retryCount = config.retryCount;
	acquirerOptions.retryDelay = std::chrono::seconds(config.retryDelaySeconds);
	acquirerOptions.concurrency = config.fetchConcurrency;
	acquirerOptions.extension = config.audioExtension;

	auto acquirer = std::make_shared<const Pipeline::ChunkAcquirer>(
		std::make_shared<const Pipeline::CurlChunkFetcher>(logger), acquirerOptions, logger);
	auto codec = std::make_shared<const AudioCodec::FFmpegAudioCodec>(config.ffmpegPath, config.ffprobePath, logger);

	const Pipeline::PipelineRunner runner(acquirer, codec, storage, makePackerOptions(config),
					      makeRunnerOptions(commandLine, config), logger);

	Pipeline::RunContext context;
	Pipeline::PipelineOutcome outcome;
	if (discovery) {
		outcome = runner.run(*discovery, context);
	} else {
		const std::vector<Pipeline::Chunk> chunks =
			Pipeline::scanChunkDirectory(commandLine.input, config.audioExtension, logger);
		outcome = runner.runLocal(Pipeline::titleForChunkDirectory(commandLine.input), chunks, context);
	}

	if (!outcome.succeeded()) {
		fmt::print(stderr, "Run failed: {}\n", Pipeline::toString(outcome.failureKind));
		return kExitFailure;
	}
	fmt::print("Created {} segment(s). Manifest: {}\n", outcome.segments.size(), outcome.manifestPath.string());
	return kExitSuccess;
}

} // anonymous namespace

int main(int argc, char *argv[])
{
	const std::string program = argc > 0 ? std::filesystem::path(argv[0]).filename().string() : "bookbinder";

	Cli::CommandLine commandLine;
	try {
		const std::vector<const char *> args(argc > 0 ? argv + 1 : argv, argv + argc);
		commandLine = Cli::parseCommandLine(args);
	} catch (const std::invalid_argument &e) {
		fmt::print(stderr, "{}\n\n{}", e.what(), Cli::usageText(program));
		return kExitUsage;
	}

	if (commandLine.mode == Cli::RunMode::Help) {
		fmt::print("{}", Cli::usageText(program));
		return kExitSuccess;
	}

	const std::shared_ptr<const Logger::ILogger> bootstrapLogger = Logger::PrintLogger::instance();

	Config::AppConfig config;
	try {
		config = Config::AppConfig::load(commandLine.configPath, bootstrapLogger);
		Cli::applyOverrides(commandLine, config);
		config.validate();
	} catch (const std::exception &e) {
		bootstrapLogger->error("ConfigError", {{"path", commandLine.configPath}, {"what", e.what()}});
		return kExitUsage;
	}

	const std::shared_ptr<const Logger::ILogger> logger = makeLogger(config);

	try {
		const CurlGlobalGuard curlGlobalGuard;
		if (commandLine.mode == Cli::RunMode::Analyze) {
			return runAnalyze(commandLine, config, logger);
		}
		return runPipeline(commandLine, config, logger);
	} catch (const std::exception &e) {
		logger->error("FatalError", {{"what", e.what()}});
		return kExitFailure;
	}
}
