/*
 * SPDX-FileCopyrightText: Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 * SPDX-License-Identifier: MIT
 *
 * Bookbinder GoogleDriveApi Library
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

#include <Bookbinder/CurlHelper/CurlHandle.hpp>
#include <Bookbinder/Logger/ILogger.hpp>

#include "GoogleDriveTypes.hpp"

namespace Bookbinder::GoogleDriveApi {

/// Escapes a literal for use inside a single-quoted Drive query string.
std::string escapeQueryValue(std::string_view value);

class GoogleDriveApiClient {
public:
	GoogleDriveApiClient(std::shared_ptr<CurlHelper::CurlHandle> curl, std::shared_ptr<const Logger::ILogger> logger);

	~GoogleDriveApiClient() noexcept;

	GoogleDriveApiClient(const GoogleDriveApiClient &) = delete;
	GoogleDriveApiClient &operator=(const GoogleDriveApiClient &) = delete;
	GoogleDriveApiClient(GoogleDriveApiClient &&) = delete;
	GoogleDriveApiClient &operator=(GoogleDriveApiClient &&) = delete;

	/// Follows nextPageToken for at most 20 pages.
	std::vector<GoogleDriveFile> listFiles(std::string_view accessToken, const std::string &query);

	GoogleDriveFile createFolder(std::string_view accessToken, const std::string &name,
				     const std::vector<std::string> &parents = {});

	/**
	 * Uploads a local file through a resumable upload session: the metadata is
	 * posted first and the returned session URI then receives the content in a
	 * single PUT.
	 */
	GoogleDriveFile uploadFile(std::string_view accessToken, const std::filesystem::path &path,
				   const std::string &name, const std::vector<std::string> &parents,
				   const std::string &mimeType);

private:
	const std::shared_ptr<CurlHelper::CurlHandle> curl_;
	const std::shared_ptr<const Logger::ILogger> logger_;
};

} // namespace Bookbinder::GoogleDriveApi
