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

#pragma once

#include <filesystem>
#include <memory>
#include <string>

#include <nlohmann/json_fwd.hpp>

#include <Bookbinder/Logger/ILogger.hpp>

namespace Bookbinder::Config {

struct AppConfig {
	double maxDurationMinutes = 60.0;
	double maxSizeMb = 150.0;
	int bitrateKbps = 128;
	std::string audioExtension = "mp3";

	int retryCount = 3;
	int retryDelaySeconds = 2;
	int fetchConcurrency = 1;

	std::string outputDirectory = ".";
	std::string urlHostFilter;

	std::string driveRootFolderName = "audiobooks";
	std::string clientSecretPath = "client_secret.json";
	std::string tokenPath = "token.json";

	std::string ffmpegPath = "ffmpeg";
	std::string ffprobePath = "ffprobe";

	std::string logFilePath = "bookbinder.log";
	bool keepChunks = false;

	/**
	 * Starts from the defaults and overrides every key present in the JSON
	 * file at `path`. A missing file leaves the defaults untouched. Malformed
	 * JSON or a value of the wrong type raises std::runtime_error.
	 */
	static AppConfig load(const std::filesystem::path &path, const std::shared_ptr<const Logger::ILogger> &logger);

	/// Throws std::runtime_error naming the first offending key.
	void validate() const;
};

void to_json(nlohmann::json &j, const AppConfig &p);

/// Overrides only the keys present in `j`.
void from_json(const nlohmann::json &j, AppConfig &p);

} // namespace Bookbinder::Config
