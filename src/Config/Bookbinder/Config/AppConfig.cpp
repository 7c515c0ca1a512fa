/*
 * SPDX-FileCopyrightText: Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 * SPDX-License-Identifier: MIT
 *
 * Bookbinder Config Library
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

#include "AppConfig.hpp"

#include <fstream>
#include <stdexcept>

#include <fmt/format.h>
#include <nlohmann/json.hpp>

namespace Bookbinder::Config {

namespace {

template<typename T> void overrideIfPresent(const nlohmann::json &j, const char *key, T &field)
{
	if (auto it = j.find(key); it != j.end() && !it->is_null()) {
		it->get_to(field);
	}
}

} // anonymous namespace

void to_json(nlohmann::json &j, const AppConfig &p)
{
	j = nlohmann::json{
		{"maxDurationMinutes", p.maxDurationMinutes},
		{"maxSizeMb", p.maxSizeMb},
		{"bitrateKbps", p.bitrateKbps},
		{"audioExtension", p.audioExtension},
		{"retryCount", p.retryCount},
		{"retryDelaySeconds", p.retryDelaySeconds},
		{"fetchConcurrency", p.fetchConcurrency},
		{"outputDirectory", p.outputDirectory},
		{"urlHostFilter", p.urlHostFilter},
		{"driveRootFolderName", p.driveRootFolderName},
		{"clientSecretPath", p.clientSecretPath},
		{"tokenPath", p.tokenPath},
		{"ffmpegPath", p.ffmpegPath},
		{"ffprobePath", p.ffprobePath},
		{"logFilePath", p.logFilePath},
		{"keepChunks", p.keepChunks},
	};
}

void from_json(const nlohmann::json &j, AppConfig &p)
{
	overrideIfPresent(j, "maxDurationMinutes", p.maxDurationMinutes);
	overrideIfPresent(j, "maxSizeMb", p.maxSizeMb);
	overrideIfPresent(j, "bitrateKbps", p.bitrateKbps);
	overrideIfPresent(j, "audioExtension", p.audioExtension);
	overrideIfPresent(j, "retryCount", p.retryCount);
	overrideIfPresent(j, "retryDelaySeconds", p.retryDelaySeconds);
	overrideIfPresent(j, "fetchConcurrency", p.fetchConcurrency);
	overrideIfPresent(j, "outputDirectory", p.outputDirectory);
	overrideIfPresent(j, "urlHostFilter", p.urlHostFilter);
	overrideIfPresent(j, "driveRootFolderName", p.driveRootFolderName);
	overrideIfPresent(j, "clientSecretPath", p.clientSecretPath);
	overrideIfPresent(j, "tokenPath", p.tokenPath);
	overrideIfPresent(j, "ffmpegPath", p.ffmpegPath);
	overrideIfPresent(j, "ffprobePath", p.ffprobePath);
	overrideIfPresent(j, "logFilePath", p.logFilePath);
	overrideIfPresent(j, "keepChunks", p.keepChunks);
}

AppConfig AppConfig::load(const std::filesystem::path &path, const std::shared_ptr<const Logger::ILogger> &logger)
{
	AppConfig config;

	if (!std::filesystem::is_regular_file(path)) {
		logger->info("ConfigFileNotExist", {{"path", path.string()}});
		return config;
	}

	std::ifstream ifs(path, std::ios::in);
	if (!ifs.is_open()) {
		logger->error("FileOpenError", {{"path", path.string()}});
		throw std::runtime_error("FileOpenError(AppConfig::load)");
	}

	nlohmann::json j = nlohmann::json::parse(ifs, nullptr, false);
	if (j.is_discarded() || !j.is_object()) {
		logger->error("ConfigParseError", {{"path", path.string()}});
		throw std::runtime_error("ConfigParseError(AppConfig::load)");
	}

	try {
		j.get_to(config);
	} catch (const nlohmann::json::exception &e) {
		logger->error("ConfigTypeError", {{"path", path.string()}, {"what", e.what()}});
		throw std::runtime_error("ConfigTypeError(AppConfig::load)");
	}

	const nlohmann::json known = config;
	for (const auto &[key, value] : j.items()) {
		if (known.contains(key)) {
			logger->info("ConfigKeyLoaded", {{"key", key}, {"value", value.dump()}});
		} else {
			logger->warn("ConfigKeyUnknown", {{"key", key}});
		}
	}

	return config;
}

void AppConfig::validate() const
{
	const auto fail = [](const char *key) {
		throw std::runtime_error(fmt::format("ConfigValueError(AppConfig::validate):{}", key));
	};

	if (!(maxDurationMinutes > 0.0))
		fail("maxDurationMinutes");
	if (!(maxSizeMb > 0.0))
		fail("maxSizeMb");
	if (bitrateKbps <= 0)
		fail("bitrateKbps");
	if (audioExtension.empty())
		fail("audioExtension");
	if (retryCount < 1)
		fail("retryCount");
	if (retryDelaySeconds < 0)
		fail("retryDelaySeconds");
	if (fetchConcurrency < 1)
		fail("fetchConcurrency");
	if (outputDirectory.empty())
		fail("outputDirectory");
	if (driveRootFolderName.empty())
		fail("driveRootFolderName");
	if (ffmpegPath.empty())
		fail("ffmpegPath");
	if (ffprobePath.empty())
		fail("ffprobePath");
}

} // namespace Bookbinder::Config
