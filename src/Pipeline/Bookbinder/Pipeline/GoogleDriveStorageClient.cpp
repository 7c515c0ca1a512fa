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

#include "GoogleDriveStorageClient.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <utility>
#include <vector>

#include <fmt/format.h>

#include "PipelineErrors.hpp"

namespace Bookbinder::Pipeline {

std::string mimeTypeForPath(const std::filesystem::path &path)
{
	std::string ext = path.extension().string();
	std::transform(ext.begin(), ext.end(), ext.begin(),
		       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

	if (ext == ".mp3")
		return "audio/mpeg";
	if (ext == ".m4a" || ext == ".m4b" || ext == ".aac")
		return "audio/mp4";
	if (ext == ".ogg" || ext == ".opus")
		return "audio/ogg";
	if (ext == ".json")
		return "application/json";
	if (ext == ".txt")
		return "text/plain";
	return "application/octet-stream";
}

GoogleDriveStorageClient::GoogleDriveStorageClient(std::shared_ptr<GoogleDriveApi::GoogleDriveApiClient> apiClient,
						   std::shared_ptr<const GoogleAuth::GoogleAuthManager> authManager,
						   std::shared_ptr<const GoogleAuth::GoogleTokenStorage> tokenStorage,
						   std::shared_ptr<const Logger::ILogger> logger)
	: apiClient_(apiClient ? std::move(apiClient) : throw std::invalid_argument("ApiClientIsNullError(GoogleDriveStorageClient::GoogleDriveStorageClient)")),
	  authManager_(authManager ? std::move(authManager) : throw std::invalid_argument("AuthManagerIsNullError(GoogleDriveStorageClient::GoogleDriveStorageClient)")),
	  tokenStorage_(tokenStorage ? std::move(tokenStorage) : throw std::invalid_argument("TokenStorageIsNullError(GoogleDriveStorageClient::GoogleDriveStorageClient)")),
	  logger_(logger ? std::move(logger) : throw std::invalid_argument("LoggerIsNullError(GoogleDriveStorageClient::GoogleDriveStorageClient)"))
{
}

GoogleDriveStorageClient::~GoogleDriveStorageClient() noexcept = default;

std::string GoogleDriveStorageClient::accessToken()
{
	try {
		if (!tokenState_.has_value()) {
			tokenState_ = tokenStorage_->load();
		}

		if (!tokenState_.has_value() || !tokenState_->isAuthorized()) {
			logger_->error("GoogleDriveNotAuthorized", {{"tokenPath", tokenStorage_->path().string()}});
			throw StorageError("NotAuthorizedError(GoogleDriveStorageClient::accessToken)");
		}

		if (!tokenState_->isAccessTokenFresh()) {
			logger_->info("RefreshingGoogleAccessToken");
			GoogleAuth::GoogleAuthResponse response = authManager_->fetchFreshAuthResponse(tokenState_->refresh_token);
			tokenState_ = tokenState_->withUpdatedAuthResponse(response);
			tokenStorage_->save(*tokenState_);
		}

		return tokenState_->access_token;
	} catch (const StorageError &) {
		throw;
	} catch (const std::exception &e) {
		logger_->error("GoogleAccessTokenError", {{"what", e.what()}});
		throw StorageError(fmt::format("AccessTokenError(GoogleDriveStorageClient::accessToken):{}", e.what()));
	}
}

std::string GoogleDriveStorageClient::createFolder(const std::string &name, const std::optional<std::string> &parentId)
{
	const std::string token = accessToken();
	try {
		std::vector<std::string> parents;
		if (parentId.has_value()) {
			parents.push_back(*parentId);
		}
		return apiClient_->createFolder(token, name, parents).id;
	} catch (const std::exception &e) {
		logger_->error("GoogleDriveCreateFolderError", {{"name", name}, {"what", e.what()}});
		throw StorageError(fmt::format("CreateFolderError(GoogleDriveStorageClient::createFolder):{}", e.what()));
	}
}

std::optional<std::string> GoogleDriveStorageClient::findFolder(const std::string &name,
								const std::optional<std::string> &parentId)
{
	const std::string token = accessToken();

	std::string query = fmt::format("name='{}' and mimeType='{}' and trashed=false",
					GoogleDriveApi::escapeQueryValue(name), GoogleDriveApi::kFolderMimeType);
	if (parentId.has_value()) {
		query += fmt::format(" and '{}' in parents", GoogleDriveApi::escapeQueryValue(*parentId));
	}

	try {
		std::vector<GoogleDriveApi::GoogleDriveFile> files = apiClient_->listFiles(token, query);
		if (files.empty()) {
			return std::nullopt;
		}
		if (files.size() > 1) {
			logger_->warn("GoogleDriveDuplicateFolders", {{"name", name}, {"count", std::to_string(files.size())}});
		}
		return files.front().id;
	} catch (const std::exception &e) {
		logger_->error("GoogleDriveFindFolderError", {{"name", name}, {"what", e.what()}});
		throw StorageError(fmt::format("FindFolderError(GoogleDriveStorageClient::findFolder):{}", e.what()));
	}
}

std::string GoogleDriveStorageClient::upload(const std::filesystem::path &localPath, const std::string &parentId,
					     const std::string &name)
{
	const std::string token = accessToken();
	try {
		return apiClient_->uploadFile(token, localPath, name, {parentId}, mimeTypeForPath(localPath)).id;
	} catch (const std::exception &e) {
		logger_->error("GoogleDriveUploadError", {{"path", localPath.string()}, {"what", e.what()}});
		throw StorageError(fmt::format("UploadError(GoogleDriveStorageClient::upload):{}", e.what()));
	}
}

} // namespace Bookbinder::Pipeline
