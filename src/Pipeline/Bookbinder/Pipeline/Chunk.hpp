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

#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

#include <Bookbinder/AudioCodec/AudioInfo.hpp>
#include <Bookbinder/AudioCodec/IAudioCodec.hpp>

namespace Bookbinder::Pipeline {

/**
 * One materialized unit of audio. The remote index is the 1-based position of
 * the source URL in the discovered list and is carried unchanged through
 * packing, so manifest ids never depend on which other chunks failed.
 */
class Chunk {
public:
	Chunk(int remoteIndex, std::string url, std::filesystem::path localPath, std::uint64_t byteSize);

	[[nodiscard]]
	int remoteIndex() const noexcept
	{
		return remoteIndex_;
	}

	/// 1-based and dense among materialized chunks. Zero until assigned.
	[[nodiscard]]
	int sequenceIndex() const noexcept
	{
		return sequenceIndex_;
	}

	void assignSequenceIndex(int sequenceIndex);

	/// Zero-padded remote index, e.g. "05".
	[[nodiscard]]
	std::string id() const;

	[[nodiscard]]
	const std::string &url() const noexcept
	{
		return url_;
	}

	[[nodiscard]]
	const std::filesystem::path &localPath() const noexcept
	{
		return localPath_;
	}

	[[nodiscard]]
	std::uint64_t byteSize() const noexcept
	{
		return byteSize_;
	}

	/// Probes on first use and caches the result. A DecodeError is not cached.
	const AudioCodec::AudioInfo &audioInfo(const AudioCodec::IAudioCodec &codec) const;

	[[nodiscard]]
	bool isProbed() const noexcept
	{
		return audioInfo_.has_value();
	}

private:
	int remoteIndex_;
	int sequenceIndex_ = 0;
	std::string url_;
	std::filesystem::path localPath_;
	std::uint64_t byteSize_;
	mutable std::optional<AudioCodec::AudioInfo> audioInfo_;
};

/// Manifest id for a remote index.
std::string formatChunkId(int remoteIndex);

/// Local file name for a remote index, e.g. `audio_05.mp3`.
std::string chunkFileName(int remoteIndex, const std::string &extension);

} // namespace Bookbinder::Pipeline
