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

#include "ChunkAnalyzer.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

#include <fmt/format.h>

#include "PipelineErrors.hpp"

namespace Bookbinder::Pipeline {

ChunkAnalyzer::ChunkAnalyzer(std::shared_ptr<const AudioCodec::IAudioCodec> codec, double maxDurationMinutes,
			     double maxSizeMb, std::shared_ptr<const Logger::ILogger> logger)
	: codec_(codec ? std::move(codec) : throw std::invalid_argument("CodecIsNullError(ChunkAnalyzer::ChunkAnalyzer)")),
	  maxDurationMinutes_(maxDurationMinutes),
	  maxSizeMb_(maxSizeMb),
	  logger_(logger ? std::move(logger) : throw std::invalid_argument("LoggerIsNullError(ChunkAnalyzer::ChunkAnalyzer)"))
{
}

ChunkAnalysis ChunkAnalyzer::analyze(const std::vector<Chunk> &chunks, std::size_t sampleCount) const
{
	const std::size_t limit = std::min(sampleCount, chunks.size());

	double totalMinutes = 0.0;
	double totalMb = 0.0;
	ChunkAnalysis analysis;

	for (std::size_t i = 0; i < limit; ++i) {
		const Chunk &chunk = chunks[i];
		try {
			const AudioCodec::AudioInfo &info = chunk.audioInfo(*codec_);
			const double minutes = info.durationSeconds / 60.0;
			const double mb = static_cast<double>(info.rawBytes) / (1024.0 * 1024.0);

			totalMinutes += minutes;
			totalMb += mb;
			analysis.sampledChunks++;

			logger_->info("ChunkSampled", {{"chunk", chunk.id()},
						       {"durationMinutes", fmt::format("{:.1f}", minutes)},
						       {"sizeMb", fmt::format("{:.1f}", mb)}});
		} catch (const DecodeError &e) {
			logger_->warn("ChunkSampleFailed", {{"chunk", chunk.id()}, {"error", e.what()}});
		}
	}

	if (analysis.sampledChunks == 0) {
		logger_->error("NoDecodableSample", {{"candidates", std::to_string(limit)}});
		throw DecodeError("NoDecodableSampleError(ChunkAnalyzer::analyze)");
	}

	analysis.averageDurationMinutes = totalMinutes / static_cast<double>(analysis.sampledChunks);
	analysis.averageSizeMb = totalMb / static_cast<double>(analysis.sampledChunks);
	analysis.packingRecommended =
		!(analysis.averageDurationMinutes >= maxDurationMinutes_ || analysis.averageSizeMb >= maxSizeMb_);

	logger_->info("ChunkAnalysis", {{"sampled", std::to_string(analysis.sampledChunks)},
					{"averageDurationMinutes", fmt::format("{:.1f}", analysis.averageDurationMinutes)},
					{"averageSizeMb", fmt::format("{:.1f}", analysis.averageSizeMb)},
					{"packingRecommended", analysis.packingRecommended ? "true" : "false"}});
	return analysis;
}

} // namespace Bookbinder::Pipeline
