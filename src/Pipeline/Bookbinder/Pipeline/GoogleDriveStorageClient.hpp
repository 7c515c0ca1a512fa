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

#include <memory>
#include <optional>
#include <string>

#include <Bookbinder/GoogleAuth/GoogleAuthManager.hpp>
#include <Bookbinder/GoogleAuth/GoogleTokenState.hpp>
#include <Bookbinder/GoogleAuth/GoogleTokenStorage.hpp>
#include <Bookbinder/GoogleDriveApi/GoogleDriveApiClient.hpp>
#include <Bookbinder/Logger/ILogger.hpp>

#include "IStorageClient.hpp"

namespace Bookbinder::Pipeline {

/// Content type sent with an upload, chosen from the file extension.
std::string mimeTypeForPath(const std::filesystem::path &path);

/**
 * IStorageClient on Google Drive. The access token is refreshed through
 * GoogleAuthManager when it is stale, and the refreshed token is written back
 * to the token file.
 */
class GoogleDriveStorageClient : public IStorageClient {
public:
	GoogleDriveStorageClient(std::shared_ptr<GoogleDriveApi::GoogleDriveApiClient> apiClient,
				 std::shared_ptr<const GoogleAuth::GoogleAuthManager> authManager,
				 std::shared_ptr<const GoogleAuth::GoogleTokenStorage> tokenStorage,
				 std::shared_ptr<const Logger::ILogger> logger);
	~GoogleDriveStorageClient() noexcept override;

	std::string createFolder(const std::string &name, const std::optional<std::string> &parentId) override;

	std::optional<std::string> findFolder(const std::string &name,
					      const std::optional<std::string> &parentId) override;

	std::string upload(const std::filesystem::path &localPath, const std::string &parentId,
			   const std::string &name) override;

private:
	std::string accessToken();

	const std::shared_ptr<GoogleDriveApi::GoogleDriveApiClient> apiClient_;
	const std::shared_ptr<const GoogleAuth::GoogleAuthManager> authManager_;
	const std::shared_ptr<const GoogleAuth::GoogleTokenStorage> tokenStorage_;
	const std::shared_ptr<const Logger::ILogger> logger_;

	std::optional<GoogleAuth::GoogleTokenState> tokenState_;
};

} // namespace Bookbinder::Pipeline
