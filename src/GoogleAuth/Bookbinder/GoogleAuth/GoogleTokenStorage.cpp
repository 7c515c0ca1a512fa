/*
 * SPDX-FileCopyrightText: Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 * SPDX-License-Identifier: MIT
 *
 * Bookbinder GoogleAuth Library
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

#include "GoogleTokenStorage.hpp"

#include <fstream>
#include <stdexcept>
#include <utility>

#include <nlohmann/json.hpp>

namespace Bookbinder::GoogleAuth {

GoogleTokenStorage::GoogleTokenStorage(std::filesystem::path tokenFilePath,
				       std::shared_ptr<const Logger::ILogger> logger)
	: tokenFilePath_(std::move(tokenFilePath)),
	  logger_(logger ? std::move(logger) : throw std::invalid_argument("LoggerIsNullError(GoogleTokenStorage::GoogleTokenStorage)"))
{
}

std::optional<GoogleTokenState> GoogleTokenStorage::load() const
{
	if (!std::filesystem::is_regular_file(tokenFilePath_)) {
		logger_->info("TokenFileNotExist", {{"path", tokenFilePath_.string()}});
		return std::nullopt;
	}

	std::ifstream ifs(tokenFilePath_, std::ios::in);
	if (!ifs.is_open()) {
		logger_->error("FileOpenError", {{"path", tokenFilePath_.string()}});
		throw std::runtime_error("FileOpenError(GoogleTokenStorage::load)");
	}

	try {
		nlohmann::json j = nlohmann::json::parse(ifs);
		auto state = j.get<GoogleTokenState>();
		logger_->info("RestoredGoogleTokenState", {{"path", tokenFilePath_.string()}});
		return state;
	} catch (const nlohmann::json::exception &e) {
		logger_->error("TokenFileParseError", {{"path", tokenFilePath_.string()}, {"what", e.what()}});
		throw std::runtime_error("TokenFileParseError(GoogleTokenStorage::load)");
	}
}

void GoogleTokenStorage::save(const GoogleTokenState &tokenState) const
{
	if (auto parentDirectory = tokenFilePath_.parent_path(); !parentDirectory.empty()) {
		std::filesystem::create_directories(parentDirectory);
	}

	nlohmann::json j = tokenState;

	std::filesystem::path tmpPath = tokenFilePath_;
	tmpPath += ".tmp";
	std::ofstream ofs(tmpPath, std::ios::out | std::ios::trunc);
	if (!ofs.is_open()) {
		logger_->error("FileOpenError", {{"path", tmpPath.string()}});
		throw std::runtime_error("FileOpenError(GoogleTokenStorage::save)");
	}

	ofs << j.dump(2);
	ofs.close();
	if (ofs.fail()) {
		logger_->error("FileWriteError", {{"path", tmpPath.string()}});
		throw std::runtime_error("FileWriteError(GoogleTokenStorage::save)");
	}

	std::filesystem::path bakPath = tokenFilePath_;
	bakPath += ".bak";

	if (std::filesystem::is_regular_file(tokenFilePath_)) {
		std::filesystem::rename(tokenFilePath_, bakPath);
	}
	std::filesystem::rename(tmpPath, tokenFilePath_);

	logger_->info("SavedGoogleTokenState", {{"path", tokenFilePath_.string()}});
}

} // namespace Bookbinder::GoogleAuth
