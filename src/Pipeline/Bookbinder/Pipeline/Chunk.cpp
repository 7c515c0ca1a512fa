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

#include "Chunk.hpp"

#include <stdexcept>
#include <utility>

#include <fmt/format.h>

namespace Bookbinder::Pipeline {

Chunk::Chunk(int remoteIndex, std::string url, std::filesystem::path localPath, std::uint64_t byteSize)
	: remoteIndex_(remoteIndex > 0 ? remoteIndex : throw std::invalid_argument("RemoteIndexInvalidError(Chunk::Chunk)")),
	  url_(std::move(url)),
	  localPath_(std::move(localPath)),
	  byteSize_(byteSize)
{
}

void Chunk::assignSequenceIndex(int sequenceIndex)
{
	if (sequenceIndex <= 0) {
		throw std::invalid_argument("SequenceIndexInvalidError(Chunk::assignSequenceIndex)");
	}
	sequenceIndex_ = sequenceIndex;
}

std::string Chunk::id() const
{
	return formatChunkId(remoteIndex_);
}

const AudioCodec::AudioInfo &Chunk::audioInfo(const AudioCodec::IAudioCodec &codec) const
{
	if (!audioInfo_.has_value()) {
		audioInfo_ = codec.probe(localPath_);
	}
	return *audioInfo_;
}

std::string formatChunkId(int remoteIndex)
{
	return fmt::format("{:02d}", remoteIndex);
}

std::string chunkFileName(int remoteIndex, const std::string &extension)
{
	return fmt::format("audio_{:02d}.{}", remoteIndex, extension);
}

} // namespace Bookbinder::Pipeline
