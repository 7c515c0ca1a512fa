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

#include "FFmpegAudioCodec.hpp"

#include <sys/wait.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdio>
#include <fstream>
#include <memory>
#include <stdexcept>
#include <system_error>
#include <utility>

#include <fmt/format.h>
#include <nlohmann/json.hpp>

#include "AudioCodecErrors.hpp"

namespace Bookbinder::AudioCodec {

namespace {

struct CommandResult {
	int exitCode = -1;
	std::string output;
};

CommandResult runCommand(const std::string &command)
{
	std::unique_ptr<FILE, int (*)(FILE *)> pipe(popen(command.c_str(), "r"), pclose);
	if (!pipe) {
		throw std::system_error(errno, std::generic_category(), "PopenError(runCommand)");
	}

	CommandResult result;
	std::array<char, 4096> buffer;
	std::size_t n;
	while ((n = std::fread(buffer.data(), 1, buffer.size(), pipe.get())) > 0) {
		result.output.append(buffer.data(), n);
	}

	int status = pclose(pipe.release());
	if (status != -1 && WIFEXITED(status)) {
		result.exitCode = WEXITSTATUS(status);
	}
	return result;
}

double parseNumber(const nlohmann::json &value)
{
	// ffprobe prints most numeric fields as strings.
	if (value.is_string()) {
		return std::stod(value.get<std::string>());
	}
	return value.get<double>();
}

std::string lastLine(const std::string &text)
{
	auto end = text.find_last_not_of("\r\n");
	if (end == std::string::npos)
		return {};
	auto newline = text.find_last_of('\n', end);
	auto begin = (newline == std::string::npos) ? 0 : newline + 1;
	return text.substr(begin, end - begin + 1);
}

} // anonymous namespace

std::string shellQuote(std::string_view value)
{
	std::string quoted = "'";
	for (char c : value) {
		if (c == '\'') {
			quoted += "'\\''";
		} else {
			quoted += c;
		}
	}
	quoted += '\'';
	return quoted;
}

AudioInfo parseProbeOutput(std::string_view json)
{
	nlohmann::json j = nlohmann::json::parse(json, nullptr, false);
	if (j.is_discarded() || !j.is_object()) {
		throw DecodeError("ProbeOutputParseError(parseProbeOutput)");
	}

	auto streams = j.find("streams");
	if (streams == j.end() || !streams->is_array() || streams->empty()) {
		throw DecodeError("NoAudioStreamError(parseProbeOutput)");
	}

	AudioInfo info;
	try {
		const nlohmann::json &stream = streams->front();
		info.sampleRate = static_cast<int>(parseNumber(stream.at("sample_rate")));
		info.channels = static_cast<int>(parseNumber(stream.at("channels")));
		info.durationSeconds = parseNumber(j.at("format").at("duration"));
	} catch (const nlohmann::json::exception &e) {
		throw DecodeError(fmt::format("ProbeFieldMissingError(parseProbeOutput):{}", e.what()));
	} catch (const std::logic_error &e) {
		// std::stod reports malformed numbers as invalid_argument or out_of_range.
		throw DecodeError(fmt::format("ProbeFieldInvalidError(parseProbeOutput):{}", e.what()));
	}

	if (!(info.durationSeconds > 0.0) || info.sampleRate <= 0 || info.channels <= 0) {
		throw DecodeError("ProbeFieldInvalidError(parseProbeOutput)");
	}

	const auto frames = static_cast<std::uint64_t>(std::llround(info.durationSeconds * info.sampleRate));
	info.rawBytes = frames * static_cast<std::uint64_t>(info.channels) * 2;
	return info;
}

std::string makeConcatList(const std::vector<std::filesystem::path> &inputs)
{
	std::string list;
	for (const auto &input : inputs) {
		std::string path = std::filesystem::absolute(input).string();
		std::string escaped;
		for (char c : path) {
			if (c == '\'') {
				escaped += "'\\''";
			} else {
				escaped += c;
			}
		}
		list += fmt::format("file '{}'\n", escaped);
	}
	return list;
}

std::string encoderForExtension(const std::filesystem::path &output)
{
	std::string ext = output.extension().string();
	std::transform(ext.begin(), ext.end(), ext.begin(),
		       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

	if (ext == ".mp3")
		return "libmp3lame";
	if (ext == ".m4a" || ext == ".m4b" || ext == ".aac")
		return "aac";
	if (ext == ".ogg")
		return "libvorbis";
	if (ext == ".opus")
		return "libopus";
	return {};
}

FFmpegAudioCodec::FFmpegAudioCodec(std::string ffmpegPath, std::string ffprobePath,
				   std::shared_ptr<const Logger::ILogger> logger)
	: ffmpegPath_(std::move(ffmpegPath)),
	  ffprobePath_(std::move(ffprobePath)),
	  logger_(logger ? std::move(logger) : throw std::invalid_argument("LoggerIsNullError(FFmpegAudioCodec::FFmpegAudioCodec)"))
{
}

FFmpegAudioCodec::~FFmpegAudioCodec() noexcept = default;

bool FFmpegAudioCodec::isAvailable() const
{
	const std::string command = fmt::format("{} -version >/dev/null 2>&1", shellQuote(ffmpegPath_));
	CommandResult result;
	try {
		result = runCommand(command);
	} catch (const std::system_error &e) {
		logger_->error("EncoderCheckFailed", {{"ffmpeg", ffmpegPath_}, {"what", e.what()}});
		return false;
	}

	if (result.exitCode != 0) {
		logger_->error("EncoderUnavailable", {{"ffmpeg", ffmpegPath_}, {"exitCode", std::to_string(result.exitCode)}});
		return false;
	}
	return true;
}

AudioInfo FFmpegAudioCodec::probe(const std::filesystem::path &path) const
{
	if (!std::filesystem::is_regular_file(path)) {
		logger_->error("ProbeInputNotExist", {{"path", path.string()}});
		throw DecodeError("InputNotExistError(FFmpegAudioCodec::probe):" + path.string());
	}

	const std::string command = fmt::format(
		"{} -v error -select_streams a:0 -show_entries stream=sample_rate,channels:format=duration -of json {} 2>/dev/null",
		shellQuote(ffprobePath_), shellQuote(path.string()));

	CommandResult result;
	try {
		result = runCommand(command);
	} catch (const std::system_error &e) {
		logger_->error("ProbeSpawnError", {{"path", path.string()}, {"what", e.what()}});
		throw DecodeError(fmt::format("ProbeSpawnError(FFmpegAudioCodec::probe):{}", e.what()));
	}

	if (result.exitCode != 0) {
		logger_->error("ProbeFailed", {{"path", path.string()}, {"exitCode", std::to_string(result.exitCode)}});
		throw DecodeError(fmt::format("ProbeFailedError(FFmpegAudioCodec::probe):exit code {}", result.exitCode));
	}

	try {
		AudioInfo info = parseProbeOutput(result.output);
		logger_->debug("Probed", {{"path", path.string()},
					  {"durationSeconds", fmt::format("{:.3f}", info.durationSeconds)},
					  {"sampleRate", std::to_string(info.sampleRate)},
					  {"channels", std::to_string(info.channels)}});
		return info;
	} catch (const DecodeError &e) {
		logger_->error("ProbeOutputInvalid", {{"path", path.string()}, {"what", e.what()}});
		throw;
	}
}

void FFmpegAudioCodec::encode(const std::vector<std::filesystem::path> &inputs, const std::filesystem::path &output,
			      int bitrateKbps) const
{
	if (inputs.empty()) {
		logger_->error("EncodeInputsEmpty", {{"output", output.string()}});
		throw std::invalid_argument("InputsEmptyError(FFmpegAudioCodec::encode)");
	}
	if (bitrateKbps <= 0) {
		logger_->error("EncodeBitrateInvalid", {{"bitrateKbps", std::to_string(bitrateKbps)}});
		throw std::invalid_argument("BitrateInvalidError(FFmpegAudioCodec::encode)");
	}

	std::filesystem::path listPath = output;
	listPath += ".concat.txt";
	{
		std::ofstream ofs(listPath, std::ios::out | std::ios::trunc);
		if (!ofs.is_open()) {
			logger_->error("FileOpenError", {{"path", listPath.string()}});
			throw ExportError("ConcatListOpenError(FFmpegAudioCodec::encode):" + listPath.string());
		}
		ofs << makeConcatList(inputs);
		if (!ofs) {
			logger_->error("FileWriteError", {{"path", listPath.string()}});
			throw ExportError("ConcatListWriteError(FFmpegAudioCodec::encode):" + listPath.string());
		}
	}

	std::string encoderArgs;
	if (std::string encoder = encoderForExtension(output); !encoder.empty()) {
		encoderArgs = fmt::format("-c:a {} ", encoder);
	}

	const std::string command =
		fmt::format("{} -nostdin -v error -y -f concat -safe 0 -i {} -vn {}-b:a {}k {} 2>&1",
			    shellQuote(ffmpegPath_), shellQuote(listPath.string()), encoderArgs, bitrateKbps,
			    shellQuote(output.string()));

	logger_->info("Encoding", {{"output", output.string()},
				   {"inputs", std::to_string(inputs.size())},
				   {"bitrateKbps", std::to_string(bitrateKbps)}});

	CommandResult result;
	try {
		result = runCommand(command);
	} catch (const std::system_error &e) {
		std::error_code ec;
		std::filesystem::remove(listPath, ec);
		logger_->error("EncodeSpawnError", {{"output", output.string()}, {"what", e.what()}});
		throw ExportError(fmt::format("EncodeSpawnError(FFmpegAudioCodec::encode):{}", e.what()));
	}

	std::error_code ec;
	std::filesystem::remove(listPath, ec);

	if (result.exitCode != 0) {
		logger_->error("EncodeFailed", {{"output", output.string()},
						{"exitCode", std::to_string(result.exitCode)},
						{"message", lastLine(result.output)}});
		throw ExportError(fmt::format("EncodeFailedError(FFmpegAudioCodec::encode):exit code {}", result.exitCode));
	}

	if (!std::filesystem::is_regular_file(output, ec) || std::filesystem::file_size(output, ec) == 0) {
		logger_->error("EncodeOutputMissing", {{"output", output.string()}});
		throw ExportError("OutputMissingError(FFmpegAudioCodec::encode):" + output.string());
	}
}

} // namespace Bookbinder::AudioCodec
