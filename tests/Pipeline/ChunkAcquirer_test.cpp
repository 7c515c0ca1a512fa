/*
 * SPDX-FileCopyrightText: Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 * SPDX-License-Identifier: MIT
 *
 * Bookbinder Pipeline Tests
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

#include <chrono>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include <Bookbinder/Logger/NullLogger.hpp>
#include <Bookbinder/Pipeline/ChunkAcquirer.hpp>
#include <Bookbinder/Pipeline/RunContext.hpp>

#include <Pipeline/PipelineFakes.hpp>
#include <TestSupport/TemporaryDirectory.hpp>

using namespace Bookbinder;
using namespace Bookbinder::Pipeline;
using Bookbinder::PipelineFakes::FakeChunkFetcher;

namespace {

std::vector<std::string> makeUrls(int count)
{
	std::vector<std::string> urls;
	for (int i = 1; i <= count; ++i) {
		urls.push_back("https://cdn.example.com/My%20Book/" + std::to_string(i) + ".mp3");
	}
	return urls;
}

AcquirerOptions makeOptions(int retryCount = 3, int concurrency = 1)
{
	AcquirerOptions options;
	options.retryCount = retryCount;
	options.retryDelay = std::chrono::milliseconds(0);
	options.concurrency = concurrency;
	options.extension = "mp3";
	return options;
}

} // anonymous namespace

class ChunkAcquirerTest : public ::testing::Test {
protected:
	TestSupport::TemporaryDirectory tempDir;
	std::shared_ptr<FakeChunkFetcher> fetcher = std::make_shared<FakeChunkFetcher>();
	RunContext context;
};

TEST_F(ChunkAcquirerTest, FetchesAllChunksInOrder)
{
	const auto urls = makeUrls(5);
	const ChunkAcquirer acquirer(fetcher, makeOptions(), Logger::NullLogger::instance());

	const auto chunks = acquirer.acquire(urls, tempDir.path, context);

	ASSERT_EQ(chunks.size(), 5u);
	for (int i = 0; i < 5; ++i) {
		EXPECT_EQ(chunks[i].remoteIndex(), i + 1);
		EXPECT_EQ(chunks[i].sequenceIndex(), i + 1);
		EXPECT_EQ(chunks[i].url(), urls[i]);
		EXPECT_EQ(chunks[i].localPath(), tempDir.path / chunkFileName(i + 1, "mp3"));
		EXPECT_TRUE(std::filesystem::exists(chunks[i].localPath()));
	}

	const RunStats stats = context.stats();
	EXPECT_EQ(stats.totalChunks, 5u);
	EXPECT_EQ(stats.successfulDownloads, 5u);
	EXPECT_EQ(stats.failedDownloads, 0u);
	EXPECT_EQ(stats.totalBytes, 5u * fetcher->bytesPerChunk);
	EXPECT_FALSE(context.hasFailures());
}

TEST_F(ChunkAcquirerTest, RetriesTransientFailures)
{
	const auto urls = makeUrls(3);
	fetcher->failTimes(urls[1], 2);
	const ChunkAcquirer acquirer(fetcher, makeOptions(3), Logger::NullLogger::instance());

	const auto chunks = acquirer.acquire(urls, tempDir.path, context);

	EXPECT_EQ(chunks.size(), 3u);
	EXPECT_EQ(fetcher->attempts(urls[1]), 3);
	EXPECT_EQ(fetcher->attempts(urls[0]), 1);
	EXPECT_FALSE(context.hasFailures());
}

TEST_F(ChunkAcquirerTest, ExhaustedRetriesAreRecordedAndSkipped)
{
	const auto urls = makeUrls(4);
	fetcher->failTimes(urls[2], -1);
	const ChunkAcquirer acquirer(fetcher, makeOptions(2), Logger::NullLogger::instance());

	const auto chunks = acquirer.acquire(urls, tempDir.path, context);

	ASSERT_EQ(chunks.size(), 3u);
	EXPECT_EQ(chunks[0].id(), "01");
	EXPECT_EQ(chunks[1].id(), "02");
	EXPECT_EQ(chunks[2].id(), "04");
	EXPECT_EQ(chunks[2].sequenceIndex(), 3);
	EXPECT_EQ(fetcher->attempts(urls[2]), 2);

	const auto failures = context.failures();
	ASSERT_EQ(failures.size(), 1u);
	EXPECT_EQ(failures[0].identifier, "audio_03.mp3");
	EXPECT_EQ(failures[0].url, urls[2]);
	EXPECT_EQ(failures[0].error, "Couldn't connect to server (HTTP 0)");
	EXPECT_EQ(context.stats().failedDownloads, 1u);
}

TEST_F(ChunkAcquirerTest, AllFailuresYieldNoChunks)
{
	const auto urls = makeUrls(2);
	fetcher->failTimes(urls[0], -1);
	fetcher->failTimes(urls[1], -1);
	const ChunkAcquirer acquirer(fetcher, makeOptions(1), Logger::NullLogger::instance());

	const auto chunks = acquirer.acquire(urls, tempDir.path, context);

	EXPECT_TRUE(chunks.empty());
	EXPECT_EQ(context.failures().size(), 2u);
}

TEST_F(ChunkAcquirerTest, ConcurrentFetchKeepsUrlOrder)
{
	const auto urls = makeUrls(12);
	fetcher->latency = std::chrono::milliseconds(5);
	fetcher->failTimes(urls[4], -1);
	const ChunkAcquirer acquirer(fetcher, makeOptions(1, 4), Logger::NullLogger::instance());

	const auto chunks = acquirer.acquire(urls, tempDir.path, context);

	ASSERT_EQ(chunks.size(), 11u);
	int previous = 0;
	for (std::size_t i = 0; i < chunks.size(); ++i) {
		EXPECT_GT(chunks[i].remoteIndex(), previous);
		EXPECT_EQ(chunks[i].sequenceIndex(), static_cast<int>(i + 1));
		previous = chunks[i].remoteIndex();
	}
	EXPECT_LE(fetcher->maxInFlight(), 4);
	EXPECT_EQ(context.stats().successfulDownloads, 11u);
}

TEST_F(ChunkAcquirerTest, SequentialFetchNeverOverlaps)
{
	const auto urls = makeUrls(4);
	fetcher->latency = std::chrono::milliseconds(2);
	const ChunkAcquirer acquirer(fetcher, makeOptions(1, 1), Logger::NullLogger::instance());

	acquirer.acquire(urls, tempDir.path, context);

	EXPECT_EQ(fetcher->maxInFlight(), 1);
}

TEST_F(ChunkAcquirerTest, EmptyUrlListYieldsNoChunks)
{
	const ChunkAcquirer acquirer(fetcher, makeOptions(), Logger::NullLogger::instance());

	const auto chunks = acquirer.acquire({}, tempDir.path, context);

	EXPECT_TRUE(chunks.empty());
	EXPECT_EQ(context.stats().totalChunks, 0u);
}

TEST_F(ChunkAcquirerTest, KeepsValidatedOptions)
{
	const ChunkAcquirer acquirer(fetcher, makeOptions(5, 3), Logger::NullLogger::instance());

	EXPECT_EQ(acquirer.options().retryCount, 5);
	EXPECT_EQ(acquirer.options().concurrency, 3);
	EXPECT_EQ(acquirer.options().extension, "mp3");
}

TEST_F(ChunkAcquirerTest, RejectsInvalidOptions)
{
	const auto noRetries = makeOptions(0);
	EXPECT_THROW({ ChunkAcquirer acquirer(fetcher, noRetries, Logger::NullLogger::instance()); },
		     std::invalid_argument);

	const auto noWorkers = makeOptions(3, 0);
	EXPECT_THROW({ ChunkAcquirer acquirer(fetcher, noWorkers, Logger::NullLogger::instance()); },
		     std::invalid_argument);
}
