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

#include "GoogleDriveApiClient.hpp"

#include <cstdint>
#include <fstream>
#include <stdexcept>
#include <utility>

#include <fmt/format.h>
#include <nlohmann/json.hpp>

#include <Bookbinder/CurlHelper/CurlHeaderCallback.hpp>
#include <Bookbinder/CurlHelper/CurlReadCallback.hpp>
#include <Bookbinder/CurlHelper/CurlSlistHandle.hpp>
#include <Bookbinder/CurlHelper/CurlUrlHandle.hpp>
#include <Bookbinder/CurlHelper/CurlUrlSearchParams.hpp>
#include <Bookbinder/CurlHelper/CurlWriteCallback.hpp>

namespace Bookbinder::GoogleDriveApi {

namespace {

constexpr const char *kFilesEndpoint = "https://www.googleapis.com/drive/v3/files";
constexpr const char *kUploadEndpoint = "https://www.googleapis.com/upload/drive/v3/files";
constexpr const char *kFileFields = "id,kind,name,mimeType,parents,size";

// Connect within 10 s, finish within 60 s.
constexpr CurlHelper::TransferLimits kMetadataLimits{10, 60, 0, 0};

struct HttpResponse {
	long status = 0;
	std::vector<char> body;
	CurlHelper::CurlHeaderMap headers;
};

CURL *prepareRequest(const CurlHelper::CurlHandle &curlHandle, const CurlHelper::TransferLimits &limits,
		     const std::string &url, curl_slist *headers, HttpResponse &response)
{
	curlHandle.prepare(limits);

	CURL *curl = curlHandle.get();
	curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
	curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);

	curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, CurlHelper::CurlCharVectorWriteCallback);
	curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);
	curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, CurlHelper::CurlHeaderMapCallback);
	curl_easy_setopt(curl, CURLOPT_HEADERDATA, &response.headers);
	return curl;
}

void perform(const CurlHelper::CurlHandle &curlHandle, HttpResponse &response,
	     const std::shared_ptr<const Logger::ILogger> &logger, const char *where)
{
	CURLcode res = curl_easy_perform(curlHandle.get());

	if (res != CURLE_OK) {
		logger->error("CurlPerformError", {{"error", curl_easy_strerror(res)}, {"where", where}});
		throw std::runtime_error(fmt::format("CurlPerformError({})", where));
	}

	response.status = curlHandle.responseCode();
}

HttpResponse doGet(const CurlHelper::CurlHandle &curlHandle, const std::string &url,
		   const std::shared_ptr<const Logger::ILogger> &logger, curl_slist *headers)
{
	HttpResponse response;

	prepareRequest(curlHandle, kMetadataLimits, url, headers, response);

	perform(curlHandle, response, logger, "GoogleDriveApiClient::doGet");
	return response;
}

HttpResponse doPost(const CurlHelper::CurlHandle &curlHandle, const std::string &url, std::string_view body,
		    const std::shared_ptr<const Logger::ILogger> &logger, curl_slist *headers)
{
	if (body.empty()) {
		logger->error("BodyIsEmptyError");
		throw std::invalid_argument("BodyIsEmptyError(GoogleDriveApiClient::doPost)");
	}

	HttpResponse response;

	CURL *curl = prepareRequest(curlHandle, kMetadataLimits, url, headers, response);
	curl_easy_setopt(curl, CURLOPT_POST, 1L);
	curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body.data());
	curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));

	perform(curlHandle, response, logger, "GoogleDriveApiClient::doPost");
	return response;
}

HttpResponse doPut(const CurlHelper::CurlHandle &curlHandle, const std::string &url,
		   CurlHelper::CurlFileReadSource &source, std::uintmax_t contentLength,
		   const std::shared_ptr<const Logger::ILogger> &logger, curl_slist *headers)
{
	if (!source.stream.is_open()) {
		logger->error("IfstreamIsNotOpenError");
		throw std::invalid_argument("IfstreamIsNotOpenError(GoogleDriveApiClient::doPut)");
	}

	HttpResponse response;

	// Segments can be large, so a stalled transfer is detected by throughput instead of a total timeout.
	CurlHelper::TransferLimits limits;
	limits.stallSeconds = 60;

	CURL *curl = prepareRequest(curlHandle, limits, url, headers, response);
	curl_easy_setopt(curl, CURLOPT_UPLOAD, 1L);
	curl_easy_setopt(curl, CURLOPT_INFILESIZE_LARGE, static_cast<curl_off_t>(contentLength));
	curl_easy_setopt(curl, CURLOPT_READFUNCTION, CurlHelper::CurlFileReadCallback);
	curl_easy_setopt(curl, CURLOPT_READDATA, &source);

	perform(curlHandle, response, logger, "GoogleDriveApiClient::doPut");
	return response;
}

nlohmann::json parseApiResponse(const HttpResponse &response, const std::shared_ptr<const Logger::ILogger> &logger,
				const char *where)
{
	nlohmann::json j = nlohmann::json::parse(response.body, nullptr, false);

	if (j.is_discarded()) {
		logger->error("GoogleDriveApiParseError",
			      {{"status", std::to_string(response.status)}, {"where", where}});
		throw std::runtime_error(fmt::format("ParseError({})", where));
	}

	if (j.contains("error")) {
		logger->error("GoogleDriveApiError", {{"error", j["error"].dump()}, {"where", where}});
		throw std::runtime_error(fmt::format("APIError({})", where));
	}

	return j;
}

std::string buildUrl(const char *endpoint, const CurlHelper::CurlUrlSearchParams &params)
{
	CurlHelper::CurlUrlHandle urlHandle;
	urlHandle.setUrl(endpoint);
	urlHandle.appendQuery(params.toString());
	return urlHandle.getUrl();
}

} // anonymous namespace

std::string escapeQueryValue(std::string_view value)
{
	std::string escaped;
	escaped.reserve(value.size());
	for (char c : value) {
		if (c == '\\' || c == '\'') {
			escaped += '\\';
		}
		escaped += c;
	}
	return escaped;
}

GoogleDriveApiClient::GoogleDriveApiClient(std::shared_ptr<CurlHelper::CurlHandle> curl,
					   std::shared_ptr<const Logger::ILogger> logger)
	: curl_(curl ? std::move(curl) : throw std::invalid_argument("CurlIsNullError(GoogleDriveApiClient::GoogleDriveApiClient)")),
	  logger_(logger ? std::move(logger) : throw std::invalid_argument("LoggerIsNullError(GoogleDriveApiClient::GoogleDriveApiClient)"))
{
}

GoogleDriveApiClient::~GoogleDriveApiClient() noexcept = default;

std::vector<GoogleDriveFile> GoogleDriveApiClient::listFiles(std::string_view accessToken, const std::string &query)
{
	if (accessToken.empty()) {
		logger_->error("AccessTokenIsEmptyError");
		throw std::invalid_argument("AccessTokenIsEmptyError(GoogleDriveApiClient::listFiles)");
	}

	CurlHelper::CurlSlistHandle headers;
	headers.append(fmt::format("Authorization: Bearer {}", accessToken));

	std::vector<GoogleDriveFile> files;
	std::string nextPageToken;
	int remainingPages = 20;
	do {
		CurlHelper::CurlUrlSearchParams params(curl_->get());
		params.append("q", query);
		params.append("spaces", "drive");
		params.append("fields", fmt::format("nextPageToken,files({})", kFileFields));
		if (!nextPageToken.empty()) {
			params.append("pageToken", nextPageToken);
		}

		HttpResponse response = doGet(*curl_, buildUrl(kFilesEndpoint, params), logger_, headers.get());
		nlohmann::json j = parseApiResponse(response, logger_, "GoogleDriveApiClient::listFiles");

		if (auto it = j.find("files"); it != j.end() && it->is_array()) {
			for (const auto &item : *it) {
				files.push_back(item.get<GoogleDriveFile>());
			}
		}

		if (!j.contains("nextPageToken"))
			break;

		nextPageToken = j["nextPageToken"].get<std::string>();
	} while (--remainingPages > 0);

	if (remainingPages == 0) {
		logger_->warn("GoogleDriveListTruncated", {{"query", query}});
	}

	return files;
}

GoogleDriveFile GoogleDriveApiClient::createFolder(std::string_view accessToken, const std::string &name,
						   const std::vector<std::string> &parents)
{
	if (accessToken.empty()) {
		logger_->error("AccessTokenIsEmptyError");
		throw std::invalid_argument("AccessTokenIsEmptyError(GoogleDriveApiClient::createFolder)");
	}
	if (name.empty()) {
		logger_->error("FolderNameIsEmptyError");
		throw std::invalid_argument("FolderNameIsEmptyError(GoogleDriveApiClient::createFolder)");
	}

	CurlHelper::CurlUrlSearchParams params(curl_->get());
	params.append("fields", kFileFields);

	CurlHelper::CurlSlistHandle headers;
	headers.append(fmt::format("Authorization: Bearer {}", accessToken));
	headers.append("Content-Type: application/json; charset=UTF-8");

	nlohmann::json requestBody = GoogleDriveFileMetadata{name, std::string(kFolderMimeType), parents};
	std::string bodyStr = requestBody.dump();

	HttpResponse response = doPost(*curl_, buildUrl(kFilesEndpoint, params), bodyStr, logger_, headers.get());
	nlohmann::json j = parseApiResponse(response, logger_, "GoogleDriveApiClient::createFolder");

	auto folder = j.get<GoogleDriveFile>();
	logger_->info("GoogleDriveFolderCreated", {{"name", name}, {"id", folder.id}});
	return folder;
}

GoogleDriveFile GoogleDriveApiClient::uploadFile(std::string_view accessToken, const std::filesystem::path &path,
						 const std::string &name, const std::vector<std::string> &parents,
						 const std::string &mimeType)
{
	if (accessToken.empty()) {
		logger_->error("AccessTokenIsEmptyError");
		throw std::invalid_argument("AccessTokenIsEmptyError(GoogleDriveApiClient::uploadFile)");
	}
	if (!std::filesystem::is_regular_file(path)) {
		logger_->error("UploadFileNotExistError", {{"path", path.string()}});
		throw std::invalid_argument("UploadFileNotExistError(GoogleDriveApiClient::uploadFile)");
	}

	const std::uintmax_t size = std::filesystem::file_size(path);
	const std::string authHeader = fmt::format("Authorization: Bearer {}", accessToken);

	// Step 1: open the session.
	CurlHelper::CurlUrlSearchParams params(curl_->get());
	params.append("uploadType", "resumable");
	params.append("fields", kFileFields);

	CurlHelper::CurlSlistHandle sessionHeaders;
	sessionHeaders.append(authHeader);
	sessionHeaders.append("Content-Type: application/json; charset=UTF-8");
	sessionHeaders.append(fmt::format("X-Upload-Content-Type: {}", mimeType));
	sessionHeaders.append(fmt::format("X-Upload-Content-Length: {}", size));

	nlohmann::json metadata = GoogleDriveFileMetadata{name, std::nullopt, parents};
	std::string metadataStr = metadata.dump();

	HttpResponse sessionResponse = doPost(*curl_, buildUrl(kUploadEndpoint, params), metadataStr, logger_,
					      sessionHeaders.get());

	auto location = sessionResponse.headers.find("location");
	if (sessionResponse.status != 200 || location == sessionResponse.headers.end() || location->second.empty()) {
		std::string body(sessionResponse.body.begin(), sessionResponse.body.end());
		logger_->error("UploadSessionError",
			       {{"status", std::to_string(sessionResponse.status)}, {"body", body}, {"name", name}});
		throw std::runtime_error("UploadSessionError(GoogleDriveApiClient::uploadFile)");
	}

	// Step 2: send the content.
	CurlHelper::CurlFileReadSource source;
	source.stream.open(path, std::ios::binary);
	if (!source.stream.is_open()) {
		logger_->error("UploadFileOpenError", {{"path", path.string()}});
		throw std::runtime_error("UploadFileOpenError(GoogleDriveApiClient::uploadFile)");
	}

	CurlHelper::CurlSlistHandle uploadHeaders;
	uploadHeaders.append(authHeader);
	uploadHeaders.append(fmt::format("Content-Type: {}", mimeType));

	logger_->info("GoogleDriveUploadStarted", {{"name", name}, {"bytes", std::to_string(size)}});
	HttpResponse uploadResponse = doPut(*curl_, location->second, source, size, logger_, uploadHeaders.get());
	source.stream.close();

	if (source.bytesSent != size) {
		logger_->error("UploadIncompleteError", {{"name", name},
							 {"bytes", std::to_string(size)},
							 {"sent", std::to_string(source.bytesSent)}});
		throw std::runtime_error("UploadIncompleteError(GoogleDriveApiClient::uploadFile)");
	}

	nlohmann::json j = parseApiResponse(uploadResponse, logger_, "GoogleDriveApiClient::uploadFile");

	auto file = j.get<GoogleDriveFile>();
	logger_->info("GoogleDriveUploadFinished", {{"name", name}, {"id", file.id}});
	return file;
}

} // namespace Bookbinder::GoogleDriveApi
