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

#include <cstddef>
#include <memory>
#include <vector>

#include <Bookbinder/AudioCodec/IAudioCodec.hpp>
#include <Bookbinder/Logger/ILogger.hpp>

#include "Chunk.hpp"

namespace Bookbinder::Pipeline {

struct ChunkAnalysis {
	std::size_t sampledChunks = 0;
	double averageDurationMinutes = 0.0;
	/// Average decoded size in MiB.
	double averageSizeMb = 0.0;
	bool packingRecommended = true;
};

/**
 * Samples the first few chunks to tell whether they are already as large as
 * a segment would be. Packing is recommended unless either average already
 * reaches its bound.
 */
class ChunkAnalyzer {
public:
	ChunkAnalyzer(std::shared_ptr<const AudioCodec::IAudioCodec> codec, double maxDurationMinutes, double maxSizeMb,
		      std::shared_ptr<const Logger::ILogger> logger);

	/// Throws DecodeError when none of the sampled chunks can be decoded.
	ChunkAnalysis analyze(const std::vector<Chunk> &chunks, std::size_t sampleCount = 3) const;

private:
	const std::shared_ptr<const AudioCodec::IAudioCodec> codec_;
	const double maxDurationMinutes_;
	const double maxSizeMb_;
	const std::shared_ptr<const Logger::ILogger> logger_;
};

} // namespace Bookbinder::Pipeline
