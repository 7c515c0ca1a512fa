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

#include <nlohmann/json.hpp>

#include <Bookbinder/Logger/NullLogger.hpp>
#include <Bookbinder/Pipeline/ChunkAcquirer.hpp>
#include <Bookbinder/Pipeline/LocalChunks.hpp>
#include <Bookbinder/Pipeline/PipelineRunner.hpp>

#include <Pipeline/PipelineFakes.hpp>
#include <TestSupport/TemporaryDirectory.hpp>

using namespace Bookbinder;
using namespace Bookbinder::Pipeline;
using Bookbinder::PipelineFakes::FakeAudioCodec;
using Bookbinder::PipelineFakes::FakeChunkFetcher;
using Bookbinder::PipelineFakes::FakeStorageClient;
using Bookbinder::PipelineFakes::kMiB;

class PipelineRunnerTest : public ::testing::Test {
protected:
	TestSupport::TemporaryDirectory tempDir;
	std::shared_ptr<FakeChunkFetcher> fetcher = std::make_shared<FakeChunkFetcher>();
	std::shared_ptr<FakeAudioCodec> codec = std::make_shared<FakeAudioCodec>();
	std::shared_ptr<FakeStorageClient> storage = std::make_shared<FakeStorageClient>();
	RunnerOptions runnerOptions;
	RunContext context;

	void SetUp() override { runnerOptions.outputDirectory = tempDir.path / "out"; }

	Discovery::DiscoveryResult makeDiscovery(int count, double durationSeconds = 180.0,
						 std::uint64_t rawBytes = 6 * kMiB)
	{
		Discovery::DiscoveryResult discovery;
		discovery.title = "My Book";
		for (int i = 1; i <= count; ++i) {
			discovery.urls.push_back("https://cdn.example.com/My%20Book/" + std::to_string(i) + ".mp3");
			codec->setInfo(chunkFileName(i, "mp3"), durationSeconds, rawBytes);
		}
		return discovery;
	}

	std::unique_ptr<PipelineRunner> makeRunner(std::shared_ptr<IStorageClient> storageClient)
	{
		AcquirerOptions acquirerOptions;
		acquirerOptions.retryCount = 2;
		acquirerOptions.retryDelay = std::chrono::milliseconds(0);
		acquirerOptions.concurrency = 2;

		auto acquirer = std::make_shared<const ChunkAcquirer>(fetcher, acquirerOptions, Logger::NullLogger::instance());
		return std::make_unique<PipelineRunner>(acquirer, codec, std::move(storageClient), PackerOptions{},
							runnerOptions, Logger::NullLogger::instance());
	}

	nlohmann::json readManifest(const std::filesystem::path &path) const
	{
		return nlohmann::json::parse(TestSupport::readFile(path));
	}
};

TEST_F(PipelineRunnerTest, FullRunPublishesSegmentsAndManifest)
{
	const auto runner = makeRunner(storage);

	const PipelineOutcome outcome = runner->run(makeDiscovery(26), context);

	EXPECT_EQ(outcome.state, PipelineState::Done);
	EXPECT_EQ(outcome.failureKind, FailureKind::None);
	ASSERT_EQ(outcome.segments.size(), 2u);
	EXPECT_EQ(outcome.manifestPath, runnerOptions.outputDirectory / "my_book_toc.json");
	EXPECT_FALSE(outcome.reportPath.has_value());

	const auto manifest = readManifest(outcome.manifestPath);
	EXPECT_EQ(manifest.at("book_title"), "My Book");
	EXPECT_EQ(manifest.at("total_segments"), 2);
	EXPECT_EQ(manifest.at("segments").at(0).at("file"), "my_book_segment_01.mp3");
	EXPECT_EQ(manifest.at("segments").at(1).at("original_files").size(), 6u);

	EXPECT_FALSE(std::filesystem::exists(runnerOptions.outputDirectory / "temp_my_book"));

	EXPECT_EQ(storage->createdFolders, (std::vector<std::string>{"audiobooks", "My_Book"}));
	ASSERT_EQ(storage->uploads.size(), 3u);
	EXPECT_EQ(storage->uploads[0].name, "my_book_segment_01.mp3");
	EXPECT_EQ(storage->uploads[1].name, "my_book_segment_02.mp3");
	EXPECT_EQ(storage->uploads[2].name, "my_book_toc.json");
	const auto bookFolder = storage->findFolder("My_Book", storage->findFolder("audiobooks", std::nullopt));
	ASSERT_TRUE(bookFolder.has_value());
	EXPECT_EQ(storage->uploads[2].parentId, *bookFolder);

	const RunStats stats = context.stats();
	EXPECT_EQ(stats.totalChunks, 26u);
	EXPECT_EQ(stats.successfulDownloads, 26u);
	EXPECT_TRUE(context.endTime().has_value());
}

TEST_F(PipelineRunnerTest, ReusesExistingRemoteFolders)
{
	const std::string rootId = storage->addFolder("audiobooks", std::nullopt);
	storage->addFolder("My_Book", rootId);
	const auto runner = makeRunner(storage);

	const PipelineOutcome outcome = runner->run(makeDiscovery(2), context);

	EXPECT_EQ(outcome.state, PipelineState::Done);
	EXPECT_TRUE(storage->createdFolders.empty());
	EXPECT_EQ(storage->uploads.size(), 2u);
}

TEST_F(PipelineRunnerTest, NoUrlsFailsWithEmptyManifest)
{
	const auto runner = makeRunner(storage);
	Discovery::DiscoveryResult discovery;
	discovery.title = "Unknown Book";

	const PipelineOutcome outcome = runner->run(discovery, context);

	EXPECT_EQ(outcome.state, PipelineState::Failed);
	EXPECT_EQ(outcome.failureKind, FailureKind::Discovery);
	EXPECT_TRUE(outcome.segments.empty());
	const auto manifest = readManifest(outcome.manifestPath);
	EXPECT_EQ(manifest.at("total_segments"), 0);
	EXPECT_EQ(outcome.manifestPath.filename(), "unknown_book_toc.json");
	EXPECT_TRUE(storage->uploads.empty());
}

TEST_F(PipelineRunnerTest, AllDownloadsFailingIsTotalFailure)
{
	const auto discovery = makeDiscovery(3);
	for (const auto &url : discovery.urls) {
		fetcher->failTimes(url, -1);
	}
	const auto runner = makeRunner(storage);

	const PipelineOutcome outcome = runner->run(discovery, context);

	EXPECT_EQ(outcome.state, PipelineState::Failed);
	EXPECT_EQ(outcome.failureKind, FailureKind::Acquisition);
	EXPECT_EQ(readManifest(outcome.manifestPath).at("total_segments"), 0);
	ASSERT_TRUE(outcome.reportPath.has_value());
	EXPECT_EQ(outcome.reportPath->filename(), "failed_downloads.txt");
	EXPECT_NE(TestSupport::readFile(*outcome.reportPath).find("File: audio_02.mp3"), std::string::npos);
}

TEST_F(PipelineRunnerTest, PartialFailureStillCompletes)
{
	const auto discovery = makeDiscovery(4);
	fetcher->failTimes(discovery.urls[1], -1);
	const auto runner = makeRunner(nullptr);

	const PipelineOutcome outcome = runner->run(discovery, context);

	EXPECT_EQ(outcome.state, PipelineState::Done);
	ASSERT_EQ(outcome.segments.size(), 1u);
	EXPECT_EQ(outcome.segments[0].originalFiles, (std::vector<std::string>{"01", "03", "04"}));
	ASSERT_TRUE(outcome.reportPath.has_value());
	EXPECT_TRUE(std::filesystem::exists(*outcome.reportPath));
	EXPECT_EQ(context.stats().failedDownloads, 1u);
}

TEST_F(PipelineRunnerTest, UnavailableEncoderFailsBeforePacking)
{
	codec->available = false;
	const auto runner = makeRunner(storage);

	const PipelineOutcome outcome = runner->run(makeDiscovery(2), context);

	EXPECT_EQ(outcome.state, PipelineState::Failed);
	EXPECT_EQ(outcome.failureKind, FailureKind::Encoder);
	EXPECT_TRUE(codec->encodedInputs().empty());
}

TEST_F(PipelineRunnerTest, ThrowingEncoderCheckFailsAsEncoderUnavailable)
{
	codec->throwOnAvailabilityCheck = true;
	const auto runner = makeRunner(storage);

	const PipelineOutcome outcome = runner->run(makeDiscovery(2), context);

	EXPECT_EQ(outcome.state, PipelineState::Failed);
	EXPECT_EQ(outcome.failureKind, FailureKind::Encoder);
	EXPECT_TRUE(codec->encodedInputs().empty());
	EXPECT_TRUE(context.endTime().has_value());
}

TEST_F(PipelineRunnerTest, ExportFailureKeepsDownloadedChunks)
{
	codec->failEncode = true;
	const auto runner = makeRunner(storage);

	const PipelineOutcome outcome = runner->run(makeDiscovery(2), context);

	EXPECT_EQ(outcome.state, PipelineState::Failed);
	EXPECT_EQ(outcome.failureKind, FailureKind::Export);
	EXPECT_TRUE(std::filesystem::exists(runnerOptions.outputDirectory / "temp_my_book" / "audio_01.mp3"));
	EXPECT_TRUE(storage->uploads.empty());
}

TEST_F(PipelineRunnerTest, StorageFailureKeepsLocalArtifacts)
{
	storage->failUploads = true;
	const auto runner = makeRunner(storage);

	const PipelineOutcome outcome = runner->run(makeDiscovery(2), context);

	EXPECT_EQ(outcome.state, PipelineState::Failed);
	EXPECT_EQ(outcome.failureKind, FailureKind::Storage);
	EXPECT_TRUE(std::filesystem::exists(outcome.manifestPath));
	ASSERT_EQ(outcome.segments.size(), 1u);
	EXPECT_TRUE(std::filesystem::exists(outcome.segments[0].file));
}

TEST_F(PipelineRunnerTest, KeepChunksLeavesTemporaryDirectory)
{
	runnerOptions.keepChunks = true;
	const auto runner = makeRunner(nullptr);

	const PipelineOutcome outcome = runner->run(makeDiscovery(2), context);

	EXPECT_EQ(outcome.state, PipelineState::Done);
	EXPECT_TRUE(std::filesystem::exists(runnerOptions.outputDirectory / "temp_my_book" / "audio_02.mp3"));
}

TEST_F(PipelineRunnerTest, TitleOverrideNamesOutputs)
{
	runnerOptions.titleOverride = "The Hero of Ages";
	const auto runner = makeRunner(storage);

	const PipelineOutcome outcome = runner->run(makeDiscovery(1), context);

	EXPECT_EQ(outcome.manifestPath.filename(), "the_hero_of_ages_toc.json");
	EXPECT_EQ(readManifest(outcome.manifestPath).at("book_title"), "The Hero of Ages");
	EXPECT_EQ(storage->createdFolders.back(), "The_Hero_of_Ages");
}

TEST_F(PipelineRunnerTest, LocalRunNeverRemovesSourceChunks)
{
	const auto sourceDir = tempDir.path / "temp_well_of_ascension";
	for (int i : {1, 2, 4}) {
		const std::string name = chunkFileName(i, "mp3");
		tempDir.write("temp_well_of_ascension/" + name, "data");
		codec->setInfo(name, 600.0, 1 * kMiB);
	}
	const auto chunks = scanChunkDirectory(sourceDir, "mp3", Logger::NullLogger::instance());
	const auto runner = makeRunner(nullptr);

	const PipelineOutcome outcome = runner->runLocal(titleForChunkDirectory(sourceDir), chunks, context);

	EXPECT_EQ(outcome.state, PipelineState::Done);
	ASSERT_EQ(outcome.segments.size(), 1u);
	EXPECT_EQ(outcome.segments[0].originalFiles, (std::vector<std::string>{"01", "02", "04"}));
	EXPECT_EQ(outcome.manifestPath.filename(), "well_of_ascension_toc.json");
	EXPECT_TRUE(std::filesystem::exists(sourceDir / "audio_04.mp3"));
}

TEST_F(PipelineRunnerTest, LocalRunWithoutChunksFails)
{
	const auto runner = makeRunner(nullptr);

	const PipelineOutcome outcome = runner->runLocal("Book", {}, context);

	EXPECT_EQ(outcome.state, PipelineState::Failed);
	EXPECT_EQ(outcome.failureKind, FailureKind::Acquisition);
}

TEST_F(PipelineRunnerTest, InvalidUtf8TitleStillWritesManifest)
{
	auto discovery = makeDiscovery(2);
	discovery.title = "Bad\xffTitle";
	const auto runner = makeRunner(nullptr);

	const PipelineOutcome outcome = runner->run(discovery, context);

	EXPECT_EQ(outcome.state, PipelineState::Done);
	ASSERT_TRUE(std::filesystem::exists(outcome.manifestPath));
	EXPECT_EQ(readManifest(outcome.manifestPath).at("book_title"), "Bad\xEF\xBF\xBDTitle");
	EXPECT_TRUE(context.endTime().has_value());
}

TEST_F(PipelineRunnerTest, UnexpectedErrorStillFinishesRun)
{
	storage->throwUnexpectedOnUpload = true;
	const auto runner = makeRunner(storage);

	PipelineOutcome outcome;
	EXPECT_NO_THROW(outcome = runner->run(makeDiscovery(2), context));

	EXPECT_EQ(outcome.state, PipelineState::Failed);
	EXPECT_EQ(outcome.failureKind, FailureKind::Io);
	EXPECT_TRUE(std::filesystem::exists(outcome.manifestPath));
	EXPECT_TRUE(context.endTime().has_value());
}

TEST(FailureKindTest, NamesKinds)
{
	EXPECT_EQ(toString(FailureKind::Storage), "Storage");
	EXPECT_EQ(toString(FailureKind::None), "None");
}
