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

#include "GoogleAuthManager.hpp"

#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include <Bookbinder/CurlHelper/CurlUrlSearchParams.hpp>
#include <Bookbinder/CurlHelper/CurlWriteCallback.hpp>

namespace Bookbinder::GoogleAuth {

namespace {

GoogleOAuth2ClientCredentials validated(GoogleOAuth2ClientCredentials credentials)
{
	if (credentials.client_id.empty() || credentials.client_secret.empty()) {
		throw std::invalid_argument("CredentialsMissingError(GoogleAuthManager::GoogleAuthManager)");
	}
	return credentials;
}

} // anonymous namespace

GoogleAuthManager::GoogleAuthManager(std::shared_ptr<CurlHelper::CurlHandle> curl,
				     GoogleOAuth2ClientCredentials clientCredentials,
				     std::shared_ptr<const Logger::ILogger> logger, std::string tokenEndpoint)
	: curl_(curl ? std::move(curl) : throw std::invalid_argument("CurlIsNullError(GoogleAuthManager::GoogleAuthManager)")),
	  clientCredentials_(validated(std::move(clientCredentials))),
	  logger_(logger ? std::move(logger) : throw std::invalid_argument("LoggerIsNullError(GoogleAuthManager::GoogleAuthManager)")),
	  tokenEndpoint_(std::move(tokenEndpoint))
{
}

GoogleAuthManager::~GoogleAuthManager() noexcept = default;

GoogleAuthResponse GoogleAuthManager::fetchFreshAuthResponse(const std::string &refreshToken) const
{
	if (refreshToken.empty()) {
		logger_->error("RefreshTokenMissing");
		throw std::invalid_argument("RefreshTokenMissingError(GoogleAuthManager::fetchFreshAuthResponse)");
	}

	CURL *curl = curl_->get();

	CurlHelper::TransferLimits limits;
	limits.totalTimeoutSeconds = 60;
	curl_->prepare(limits);

	CurlHelper::CurlUrlSearchParams postParams(curl);
	postParams.append("client_id", clientCredentials_.client_id);
	postParams.append("client_secret", clientCredentials_.client_secret);
	postParams.append("refresh_token", refreshToken);
	postParams.append("grant_type", "refresh_token");

	std::vector<char> readBuffer;
	std::string postData = postParams.toString();

	curl_easy_setopt(curl, CURLOPT_URL, tokenEndpoint_.c_str());
	curl_easy_setopt(curl, CURLOPT_POST, 1L);
	curl_easy_setopt(curl, CURLOPT_POSTFIELDS, postData.c_str());
	curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(postData.length()));

	curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, CurlHelper::CurlCharVectorWriteCallback);
	curl_easy_setopt(curl, CURLOPT_WRITEDATA, &readBuffer);

	CURLcode res = curl_easy_perform(curl);

	if (res != CURLE_OK) {
		logger_->error("CurlPerformError", {{"error", curl_easy_strerror(res)}, {"endpoint", tokenEndpoint_}});
		throw std::runtime_error("NetworkError(GoogleAuthManager::fetchFreshAuthResponse)");
	}

	nlohmann::json j = nlohmann::json::parse(readBuffer, nullptr, false);
	if (j.is_discarded()) {
		logger_->error("GoogleOAuth2ResponseParseError");
		throw std::runtime_error("ParseError(GoogleAuthManager::fetchFreshAuthResponse)");
	}

	if (j.contains("error")) {
		std::string errorJson = j["error"].dump();
		logger_->error("GoogleOAuth2Error",
			       {{"error", errorJson}, {"status", std::to_string(curl_->responseCode())}});
		throw std::runtime_error("APIError(GoogleAuthManager::fetchFreshAuthResponse)");
	}

	logger_->info("GoogleAccessTokenRefreshed");
	return j.get<GoogleAuthResponse>();
}

} // namespace Bookbinder::GoogleAuth
