/*
 * SPDX-FileCopyrightText: Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 * SPDX-License-Identifier: MIT
 *
 * Bookbinder AudioCodec Tests
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

#include <sys/resource.h>

#include <Bookbinder/AudioCodec/AudioCodecErrors.hpp>
#include <Bookbinder/AudioCodec/FFmpegAudioCodec.hpp>
#include <Bookbinder/Logger/NullLogger.hpp>

#include <TestSupport/TemporaryDirectory.hpp>

using namespace Bookbinder;
using namespace Bookbinder::AudioCodec;

TEST(ParseProbeOutputTest, ReadsStringEncodedFields)
{
	const char *json = R"({
		"programs": [],
		"streams": [{"sample_rate": "44100", "channels": 2}],
		"format": {"duration": "2.500000"}
	})";

	const AudioInfo info = parseProbeOutput(json);

	EXPECT_DOUBLE_EQ(info.durationSeconds, 2.5);
	EXPECT_EQ(info.sampleRate, 44100);
	EXPECT_EQ(info.channels, 2);
	EXPECT_EQ(info.rawBytes, 441000u);
}

TEST(ParseProbeOutputTest, RejectsOutputWithoutAudioStream)
{
	EXPECT_THROW(parseProbeOutput(R"({"streams": [], "format": {"duration": "1.0"}})"), DecodeError);
	EXPECT_THROW(parseProbeOutput("Invalid data found when processing input"), DecodeError);
}

TEST(ParseProbeOutputTest, RejectsMissingOrInvalidFields)
{
	EXPECT_THROW(parseProbeOutput(R"({"streams": [{"channels": 1}], "format": {"duration": "1.0"}})"),
		     DecodeError);
	EXPECT_THROW(parseProbeOutput(R"({"streams": [{"sample_rate": "N/A", "channels": 1}], "format": {"duration": "1"}})"),
		     DecodeError);
	EXPECT_THROW(parseProbeOutput(R"({"streams": [{"sample_rate": "8000", "channels": 1}], "format": {"duration": "0"}})"),
		     DecodeError);
}

TEST(ShellQuoteTest, QuotesSingleQuotes)
{
	EXPECT_EQ(shellQuote("plain"), "'plain'");
	EXPECT_EQ(shellQuote("it's"), "'it'\\''s'");
	EXPECT_EQ(shellQuote("$(rm -rf /)"), "'$(rm -rf /)'");
}

TEST(MakeConcatListTest, WritesOneAbsoluteFileLinePerInput)
{
	const std::filesystem::path first = "/tmp/book/audio_01.mp3";
	const std::filesystem::path second = "/tmp/book/Harry's/audio_02.mp3";

	EXPECT_EQ(makeConcatList({first, second}),
		  "file '/tmp/book/audio_01.mp3'\nfile '/tmp/book/Harry'\\''s/audio_02.mp3'\n");
}

TEST(EncoderForExtensionTest, MapsKnownContainers)
{
	EXPECT_EQ(encoderForExtension("out/book_segment_01.mp3"), "libmp3lame");
	EXPECT_EQ(encoderForExtension("book.M4B"), "aac");
	EXPECT_EQ(encoderForExtension("book.opus"), "libopus");
	EXPECT_EQ(encoderForExtension("book.wav"), "");
}

TEST(FFmpegAudioCodecTest, MissingBinaryIsUnavailable)
{
	const FFmpegAudioCodec codec("/nonexistent/ffmpeg", "/nonexistent/ffprobe", Logger::NullLogger::instance());

	EXPECT_FALSE(codec.isAvailable());
}

TEST(FFmpegAudioCodecTest, ProcessSpawnFailureIsUnavailable)
{
	const FFmpegAudioCodec codec("ffmpeg", "ffprobe", Logger::NullLogger::instance());

	rlimit original{};
	ASSERT_EQ(getrlimit(RLIMIT_NOFILE, &original), 0);
	// With only the standard streams allowed, popen cannot create its pipe.
	rlimit exhausted = original;
	exhausted.rlim_cur = 3;
	ASSERT_EQ(setrlimit(RLIMIT_NOFILE, &exhausted), 0);

	bool available = true;
	EXPECT_NO_THROW(available = codec.isAvailable());

	ASSERT_EQ(setrlimit(RLIMIT_NOFILE, &original), 0);
	EXPECT_FALSE(available);
}

TEST(FFmpegAudioCodecTest, ProbeOfMissingFileIsDecodeError)
{
	TestSupport::TemporaryDirectory tempDir;
	const FFmpegAudioCodec codec("ffmpeg", "ffprobe", Logger::NullLogger::instance());

	EXPECT_THROW(codec.probe(tempDir.path / "audio_01.mp3"), DecodeError);
}

TEST(FFmpegAudioCodecTest, EncodeRejectsEmptyInputsAndBadBitrate)
{
	TestSupport::TemporaryDirectory tempDir;
	const FFmpegAudioCodec codec("ffmpeg", "ffprobe", Logger::NullLogger::instance());
	const auto input = tempDir.write("audio_01.mp3", "x");

	EXPECT_THROW(codec.encode({}, tempDir.path / "out.mp3", 128), std::invalid_argument);
	EXPECT_THROW(codec.encode({input}, tempDir.path / "out.mp3", 0), std::invalid_argument);
}

TEST(FFmpegAudioCodecTest, UnrunnableEncoderIsExportError)
{
	TestSupport::TemporaryDirectory tempDir;
	const FFmpegAudioCodec codec("/nonexistent/ffmpeg", "/nonexistent/ffprobe", Logger::NullLogger::instance());
	const auto input = tempDir.write("audio_01.mp3", "x");

	EXPECT_THROW(codec.encode({input}, tempDir.path / "out.mp3", 128), ExportError);
	EXPECT_FALSE(std::filesystem::exists(tempDir.path / "out.mp3.concat.txt"));
}
