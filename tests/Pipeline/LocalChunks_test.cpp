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

#include <filesystem>
#include <stdexcept>

#include <Bookbinder/Logger/NullLogger.hpp>
#include <Bookbinder/Pipeline/LocalChunks.hpp>

#include <TestSupport/TemporaryDirectory.hpp>

using namespace Bookbinder;
using namespace Bookbinder::Pipeline;

TEST(LocalChunksTest, ScansNumberedFilesInNumericOrder)
{
	TestSupport::TemporaryDirectory tempDir;
	tempDir.write("audio_10.mp3", "ten");
	tempDir.write("audio_02.mp3", "two");
	tempDir.write("audio_1.mp3", "one");
	tempDir.write("audio_03.m4a", "other extension");
	tempDir.write("cover.jpg", "image");
	tempDir.write("audio_x.mp3", "not numbered");
	std::filesystem::create_directories(tempDir.path / "audio_04.mp3");

	const auto chunks = scanChunkDirectory(tempDir.path, "mp3", Logger::NullLogger::instance());

	ASSERT_EQ(chunks.size(), 3u);
	EXPECT_EQ(chunks[0].id(), "01");
	EXPECT_EQ(chunks[1].id(), "02");
	EXPECT_EQ(chunks[2].id(), "10");
	EXPECT_EQ(chunks[2].sequenceIndex(), 3);
	EXPECT_EQ(chunks[2].byteSize(), 3u);
	EXPECT_TRUE(chunks[0].url().empty());
}

TEST(LocalChunksTest, ExtensionMatchIsCaseInsensitive)
{
	TestSupport::TemporaryDirectory tempDir;
	tempDir.write("audio_01.MP3", "x");

	EXPECT_EQ(scanChunkDirectory(tempDir.path, "mp3", Logger::NullLogger::instance()).size(), 1u);
}

TEST(LocalChunksTest, RejectsMissingDirectoryAndBadExtension)
{
	TestSupport::TemporaryDirectory tempDir;

	const auto logger = Logger::NullLogger::instance();

	EXPECT_THROW(scanChunkDirectory(tempDir.path / "missing", "mp3", logger), std::runtime_error);
	EXPECT_THROW(scanChunkDirectory(tempDir.path, "mp.*", logger), std::invalid_argument);
	EXPECT_THROW(scanChunkDirectory(tempDir.path, "", logger), std::invalid_argument);
}

TEST(LocalChunksTest, RepeatedNumberKeepsFirstFileByName)
{
	TestSupport::TemporaryDirectory tempDir;
	tempDir.write("audio_1.mp3", "first");
	tempDir.write("audio_01.mp3", "second");
	tempDir.write("audio_2.mp3", "b");

	const auto chunks = scanChunkDirectory(tempDir.path, "mp3", Logger::NullLogger::instance());

	ASSERT_EQ(chunks.size(), 2u);
	EXPECT_EQ(chunks[0].id(), "01");
	EXPECT_EQ(chunks[0].localPath().filename(), "audio_01.mp3");
	EXPECT_EQ(chunks[1].id(), "02");
	EXPECT_EQ(chunks[1].sequenceIndex(), 2);
}

TEST(LocalChunksTest, TitleFromDirectoryName)
{
	EXPECT_EQ(titleForChunkDirectory("temp_well_of_ascension"), "Well Of Ascension");
	EXPECT_EQ(titleForChunkDirectory("/data/chunks/temp_the_hero/"), "The Hero");
	EXPECT_EQ(titleForChunkDirectory("my book"), "My Book");
	EXPECT_EQ(titleForChunkDirectory("temp_"), "");
}
