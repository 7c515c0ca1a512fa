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

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include <Bookbinder/AudioCodec/IAudioCodec.hpp>
#include <Bookbinder/Logger/ILogger.hpp>

#include "Chunk.hpp"
#include "RunContext.hpp"
#include "SegmentSummary.hpp"

namespace Bookbinder::Pipeline {

struct PackerOptions {
	double maxDurationMinutes = 60.0;
	/// Bound on the accumulated decoded size, in MiB.
	double maxSizeMb = 150.0;
	int bitrateKbps = 128;
	std::string extension = "mp3";
	std::filesystem::path outputDirectory = ".";
	std::string bookSlug;
};

/// `{slug}_segment_{NN}.{ext}`
std::string segmentFileName(const std::string &bookSlug, int index, const std::string &extension);

/**
 * Streams chunks into segments bounded by duration and decoded size.
 *
 * Chunks are appended in input order. After each append the open segment is
 * closed when its duration reaches the bound, its decoded size reaches the
 * bound, or the chunk was the last input, with at most one close per append.
 * A chunk that fails to decode is recorded and skipped. Chunks still open
 * after the last input (because trailing inputs failed to decode) are closed
 * as a final segment.
 */
class SegmentPacker {
public:
	SegmentPacker(std::shared_ptr<const AudioCodec::IAudioCodec> codec, PackerOptions options,
		      std::shared_ptr<const Logger::ILogger> logger);
	~SegmentPacker() noexcept;

	SegmentPacker(const SegmentPacker &) = delete;
	SegmentPacker &operator=(const SegmentPacker &) = delete;
	SegmentPacker(SegmentPacker &&) = delete;
	SegmentPacker &operator=(SegmentPacker &&) = delete;

	/// Throws ExportError when a segment cannot be written.
	std::vector<SegmentSummary> pack(const std::vector<Chunk> &chunks, RunContext &context) const;

	[[nodiscard]]
	const PackerOptions &options() const noexcept
	{
		return options_;
	}

private:
	struct OpenSegment {
		std::vector<std::filesystem::path> inputs;
		std::vector<std::string> ids;
		double durationSeconds = 0.0;
		std::uint64_t rawBytes = 0;

		bool empty() const noexcept { return inputs.empty(); }
	};

	SegmentSummary close(const OpenSegment &segment, int index, const char *reason) const;

	const std::shared_ptr<const AudioCodec::IAudioCodec> codec_;
	const PackerOptions options_;
	const std::shared_ptr<const Logger::ILogger> logger_;
};

} // namespace Bookbinder::Pipeline
