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

#include "SegmentPacker.hpp"

#include <cmath>
#include <stdexcept>
#include <system_error>
#include <utility>

#include <fmt/format.h>

#include "PipelineErrors.hpp"

namespace Bookbinder::Pipeline {

namespace {

constexpr double kBytesPerMb = 1024.0 * 1024.0;

double roundTo2(double value)
{
	return std::round(value * 100.0) / 100.0;
}

PackerOptions validated(PackerOptions options)
{
	if (!(options.maxDurationMinutes > 0.0)) {
		throw std::invalid_argument("MaxDurationInvalidError(SegmentPacker::SegmentPacker)");
	}
	if (!(options.maxSizeMb > 0.0)) {
		throw std::invalid_argument("MaxSizeInvalidError(SegmentPacker::SegmentPacker)");
	}
	if (options.bitrateKbps <= 0) {
		throw std::invalid_argument("BitrateInvalidError(SegmentPacker::SegmentPacker)");
	}
	if (options.bookSlug.empty()) {
		throw std::invalid_argument("BookSlugIsEmptyError(SegmentPacker::SegmentPacker)");
	}
	return options;
}

} // anonymous namespace

std::string segmentFileName(const std::string &bookSlug, int index, const std::string &extension)
{
	return fmt::format("{}_segment_{:02d}.{}", bookSlug, index, extension);
}

SegmentPacker::SegmentPacker(std::shared_ptr<const AudioCodec::IAudioCodec> codec, PackerOptions options,
			     std::shared_ptr<const Logger::ILogger> logger)
	: codec_(codec ? std::move(codec) : throw std::invalid_argument("CodecIsNullError(SegmentPacker::SegmentPacker)")),
	  options_(validated(std::move(options))),
	  logger_(logger ? std::move(logger) : throw std::invalid_argument("LoggerIsNullError(SegmentPacker::SegmentPacker)"))
{
}

SegmentPacker::~SegmentPacker() noexcept = default;

std::vector<SegmentSummary> SegmentPacker::pack(const std::vector<Chunk> &chunks, RunContext &context) const
{
	const double maxDurationSeconds = options_.maxDurationMinutes * 60.0;
	const double maxRawBytes = options_.maxSizeMb * kBytesPerMb;

	logger_->info("PackingStarted", {{"chunks", std::to_string(chunks.size())},
					 {"maxDurationMinutes", fmt::format("{}", options_.maxDurationMinutes)},
					 {"maxSizeMb", fmt::format("{}", options_.maxSizeMb)}});

	std::vector<SegmentSummary> segments;
	OpenSegment open;

	for (std::size_t i = 0; i < chunks.size(); ++i) {
		const Chunk &chunk = chunks[i];
		const bool isLast = (i + 1 == chunks.size());

		AudioCodec::AudioInfo info;
		try {
			info = chunk.audioInfo(*codec_);
		} catch (const DecodeError &e) {
			const std::string fileName = chunk.localPath().filename().string();
			logger_->warn("ChunkDecodeFailed", {{"file", fileName}, {"error", e.what()}});
			context.recordDecodeFailure(FailureRecord{fileName, chunk.url().empty() ? "N/A" : chunk.url(),
								  fmt::format("Processing error: {}", e.what())});
			continue;
		}

		open.inputs.push_back(chunk.localPath());
		open.ids.push_back(chunk.id());
		open.durationSeconds += info.durationSeconds;
		open.rawBytes += info.rawBytes;

		logger_->debug("ChunkAppended", {{"chunk", chunk.id()}, {"segment", std::to_string(segments.size() + 1)}});

		const char *reason = nullptr;
		if (open.durationSeconds >= maxDurationSeconds) {
			reason = "duration";
		} else if (static_cast<double>(open.rawBytes) >= maxRawBytes) {
			reason = "size";
		} else if (isLast) {
			reason = "last";
		}

		if (reason) {
			segments.push_back(close(open, static_cast<int>(segments.size()) + 1, reason));
			open = OpenSegment{};
		}
	}

	if (!open.empty()) {
		segments.push_back(close(open, static_cast<int>(segments.size()) + 1, "trailing"));
	}

	logger_->info("PackingFinished", {{"segments", std::to_string(segments.size())}});
	return segments;
}

SegmentSummary SegmentPacker::close(const OpenSegment &segment, int index, const char *reason) const
{
	const std::string fileName = segmentFileName(options_.bookSlug, index, options_.extension);
	const std::filesystem::path output = options_.outputDirectory / fileName;

	logger_->info("SegmentClosing", {{"segment", std::to_string(index)},
					 {"file", fileName},
					 {"reason", reason},
					 {"chunks", std::to_string(segment.inputs.size())}});

	codec_->encode(segment.inputs, output, options_.bitrateKbps);

	std::error_code ec;
	const auto exportedBytes = std::filesystem::file_size(output, ec);
	if (ec) {
		logger_->error("SegmentOutputMissing", {{"file", output.string()}, {"error", ec.message()}});
		throw ExportError("SegmentOutputMissingError(SegmentPacker::close):" + output.string());
	}

	SegmentSummary summary;
	summary.index = index;
	summary.file = output;
	summary.fileName = fileName;
	summary.durationMinutes = roundTo2(segment.durationSeconds / 60.0);
	summary.sizeMb = roundTo2(static_cast<double>(exportedBytes) / kBytesPerMb);
	summary.originalFiles = segment.ids;
	summary.rawDurationSeconds = segment.durationSeconds;
	summary.rawBytes = segment.rawBytes;

	logger_->info("SegmentClosed", {{"segment", std::to_string(index)},
					{"durationMinutes", fmt::format("{:.2f}", summary.durationMinutes)},
					{"sizeMb", fmt::format("{:.2f}", summary.sizeMb)}});
	return summary;
}

} // namespace Bookbinder::Pipeline
