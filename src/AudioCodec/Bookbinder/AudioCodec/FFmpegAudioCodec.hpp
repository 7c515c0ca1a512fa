/*
 * SPDX-FileCopyrightText: Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 * SPDX-License-Identifier: MIT
 *
 * Bookbinder AudioCodec Library
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
#include <string_view>
#include <vector>

#include <Bookbinder/Logger/ILogger.hpp>

#include "IAudioCodec.hpp"

namespace Bookbinder::AudioCodec {

/// Wraps `value` in single quotes for /bin/sh.
std::string shellQuote(std::string_view value);

/// Parses the JSON printed by `ffprobe -show_entries stream=sample_rate,channels:format=duration -of json`.
AudioInfo parseProbeOutput(std::string_view json);

/// Contents of an ffmpeg concat demuxer list for `inputs`.
std::string makeConcatList(const std::vector<std::filesystem::path> &inputs);

/// Encoder argument for the container implied by the output extension, or empty for ffmpeg's default.
std::string encoderForExtension(const std::filesystem::path &output);

/**
 * IAudioCodec backed by the ffprobe and ffmpeg command-line tools.
 */
class FFmpegAudioCodec : public IAudioCodec {
public:
	FFmpegAudioCodec(std::string ffmpegPath, std::string ffprobePath, std::shared_ptr<const Logger::ILogger> logger);
	~FFmpegAudioCodec() noexcept override;

	bool isAvailable() const override;

	AudioInfo probe(const std::filesystem::path &path) const override;

	void encode(const std::vector<std::filesystem::path> &inputs, const std::filesystem::path &output,
		    int bitrateKbps) const override;

private:
	const std::string ffmpegPath_;
	const std::string ffprobePath_;
	const std::shared_ptr<const Logger::ILogger> logger_;
};

} // namespace Bookbinder::AudioCodec
