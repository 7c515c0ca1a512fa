/*
 * SPDX-FileCopyrightText: Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 * SPDX-License-Identifier: MIT
 *
 * Bookbinder Pipeline Library
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

#include "ChunkAcquirer.hpp"

#include <algorithm>
#include <atomic>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <thread>
#include <utility>

#include <fmt/format.h>

#include "PipelineErrors.hpp"

namespace Bookbinder::Pipeline {

namespace {

AcquirerOptions validated(AcquirerOptions options)
{
	if (options.retryCount < 1) {
		throw std::invalid_argument("RetryCountInvalidError(ChunkAcquirer::ChunkAcquirer)");
	}
	if (options.concurrency < 1) {
		throw std::invalid_argument("ConcurrencyInvalidError(ChunkAcquirer::ChunkAcquirer)");
	}
	if (options.retryDelay < std::chrono::milliseconds::zero()) {
		throw std::invalid_argument("RetryDelayInvalidError(ChunkAcquirer::ChunkAcquirer)");
	}
	return options;
}

} // anonymous namespace

ChunkAcquirer::ChunkAcquirer(std::shared_ptr<const IChunkFetcher> fetcher, AcquirerOptions options,
			     std::shared_ptr<const Logger::ILogger> logger)
	: fetcher_(fetcher ? std::move(fetcher) : throw std::invalid_argument("FetcherIsNullError(ChunkAcquirer::ChunkAcquirer)")),
	  options_(validated(std::move(options))),
	  logger_(logger ? std::move(logger) : throw std::invalid_argument("LoggerIsNullError(ChunkAcquirer::ChunkAcquirer)"))
{
}

ChunkAcquirer::~ChunkAcquirer() noexcept = default;

std::vector<Chunk> ChunkAcquirer::acquire(const std::vector<std::string> &urls, const std::filesystem::path &directory,
					  RunContext &context) const
{
	context.setTotalChunks(urls.size());
	if (urls.empty()) {
		return {};
	}

	std::filesystem::create_directories(directory);

	// Each slot is written by exactly one worker, so results need no lock.
	std::vector<std::optional<Chunk>> results(urls.size());
	std::atomic<std::size_t> nextIndex{0};
	std::atomic<std::size_t> completed{0};

	const std::size_t total = urls.size();
	const auto worker = [&]() {
		for (std::size_t i = nextIndex.fetch_add(1); i < total; i = nextIndex.fetch_add(1)) {
			results[i] = acquireOne(static_cast<int>(i + 1), urls[i], directory, context);

			const std::size_t done = completed.fetch_add(1) + 1;
			logger_->info("AcquireProgress",
				      {{"percent", fmt::format("{:.1f}", 100.0 * static_cast<double>(done) / static_cast<double>(total))},
				       {"completed", fmt::format("{}/{}", done, total)}});
		}
	};

	const std::size_t workerCount = std::min(total, static_cast<std::size_t>(options_.concurrency));
	{
		std::vector<std::jthread> workers;
		workers.reserve(workerCount);
		for (std::size_t w = 0; w < workerCount; ++w) {
			workers.emplace_back(worker);
		}
	}

	std::vector<Chunk> chunks;
	chunks.reserve(total);
	for (auto &result : results) {
		if (result.has_value()) {
			chunks.push_back(std::move(*result));
			chunks.back().assignSequenceIndex(static_cast<int>(chunks.size()));
		}
	}

	logger_->info("AcquireFinished", {{"materialized", std::to_string(chunks.size())},
					  {"failed", std::to_string(total - chunks.size())}});
	return chunks;
}

std::optional<Chunk> ChunkAcquirer::acquireOne(int remoteIndex, const std::string &url,
					       const std::filesystem::path &directory, RunContext &context) const
{
	const std::string fileName = chunkFileName(remoteIndex, options_.extension);
	const std::filesystem::path destination = directory / fileName;

	std::string lastError;
	for (int attempt = 1; attempt <= options_.retryCount; ++attempt) {
		logger_->info("ChunkFetchAttempt", {{"file", fileName},
						    {"attempt", fmt::format("{}/{}", attempt, options_.retryCount)}});
		try {
			const std::uint64_t bytes = fetcher_->fetch(url, destination);
			context.recordDownload(bytes);
			logger_->info("ChunkFetched", {{"file", fileName},
						       {"sizeMb", fmt::format("{:.1f}", static_cast<double>(bytes) / (1024.0 * 1024.0))}});
			return Chunk(remoteIndex, url, destination, bytes);
		} catch (const std::exception &e) {
			lastError = e.what();
			logger_->warn("ChunkFetchAttemptFailed",
				      {{"file", fileName}, {"attempt", std::to_string(attempt)}, {"error", lastError}});
		}

		if (attempt < options_.retryCount && options_.retryDelay > std::chrono::milliseconds::zero()) {
			std::this_thread::sleep_for(options_.retryDelay);
		}
	}

	logger_->error("ChunkFetchFailed", {{"file", fileName}, {"url", url}, {"attempts", std::to_string(options_.retryCount)}});
	context.recordDownloadFailure(FailureRecord{fileName, url, lastError});
	return std::nullopt;
}

} // namespace Bookbinder::Pipeline
