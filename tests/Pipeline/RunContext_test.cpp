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
#include <string>
#include <thread>
#include <vector>

#include <Bookbinder/Pipeline/RunContext.hpp>

#include <TestSupport/TemporaryDirectory.hpp>

using namespace Bookbinder;
using namespace Bookbinder::Pipeline;

TEST(RunContextTest, CountsDownloadsAndFailures)
{
	RunContext context;
	context.setTotalChunks(3);
	context.recordDownload(100);
	context.recordDownload(50);
	context.recordDownloadFailure({"audio_03.mp3", "https://example.com/3.mp3", "timeout"});

	const RunStats stats = context.stats();
	EXPECT_EQ(stats.totalChunks, 3u);
	EXPECT_EQ(stats.successfulDownloads, 2u);
	EXPECT_EQ(stats.failedDownloads, 1u);
	EXPECT_EQ(stats.totalBytes, 150u);
	EXPECT_EQ(stats.decodeFailures, 0u);
	EXPECT_TRUE(context.hasFailures());
}

TEST(RunContextTest, ConcurrentRecordingIsConsistent)
{
	RunContext context;
	{
		std::vector<std::jthread> threads;
		for (int t = 0; t < 4; ++t) {
			threads.emplace_back([&context]() {
				for (int i = 0; i < 250; ++i) {
					context.recordDownload(2);
				}
			});
		}
	}

	EXPECT_EQ(context.stats().successfulDownloads, 1000u);
	EXPECT_EQ(context.stats().totalBytes, 2000u);
}

TEST(RunContextTest, ElapsedUsesEndTimeOnceMarked)
{
	RunContext context;
	const auto start = RunContext::Clock::from_time_t(1000);
	EXPECT_EQ(context.elapsed(start), RunContext::Clock::duration::zero());

	context.markStart(start);
	EXPECT_EQ(context.elapsed(start + std::chrono::seconds(5)), std::chrono::seconds(5));

	context.markEnd(start + std::chrono::seconds(7));
	EXPECT_EQ(context.elapsed(start + std::chrono::seconds(100)), std::chrono::seconds(7));
	ASSERT_TRUE(context.endTime().has_value());
}

TEST(RunContextTest, WritesFailureReport)
{
	TestSupport::TemporaryDirectory tempDir;
	RunContext context;
	context.recordDownloadFailure({"audio_03.mp3", "https://example.com/3.mp3", "HTTP 404"});
	context.recordDecodeFailure({"audio_07.mp3", "", "Processing error: bad header"});

	const auto path = tempDir.path / "failed_downloads.txt";
	context.writeFailureReport(path, RunContext::Clock::from_time_t(1735787045));

	EXPECT_EQ(TestSupport::readFile(path), "Bookbinder - Failed Downloads Report\n"
					       "Generated: 2025-01-02T03:04:05Z\n"
					       "\n"
					       "File: audio_03.mp3\n"
					       "URL: https://example.com/3.mp3\n"
					       "Error: HTTP 404\n"
					       "\n"
					       "File: audio_07.mp3\n"
					       "URL: N/A\n"
					       "Error: Processing error: bad header\n"
					       "\n");
}
