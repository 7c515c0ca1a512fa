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

#pragma once

#include <memory>
#include <string>

#include <Bookbinder/CurlHelper/CurlHandle.hpp>
#include <Bookbinder/Logger/ILogger.hpp>

#include "GoogleAuthResponse.hpp"
#include "GoogleOAuth2ClientCredentials.hpp"

namespace Bookbinder::GoogleAuth {

/**
 * Refreshes access tokens at the OAuth token endpoint. The interactive
 * consent flow is not handled here: a refresh token must already exist.
 */
class GoogleAuthManager {
public:
	GoogleAuthManager(std::shared_ptr<CurlHelper::CurlHandle> curl, GoogleOAuth2ClientCredentials clientCredentials,
			  std::shared_ptr<const Logger::ILogger> logger,
			  std::string tokenEndpoint = "https://oauth2.googleapis.com/token");
	~GoogleAuthManager() noexcept;

	GoogleAuthManager(const GoogleAuthManager &) = delete;
	GoogleAuthManager &operator=(const GoogleAuthManager &) = delete;
	GoogleAuthManager(GoogleAuthManager &&) = delete;
	GoogleAuthManager &operator=(GoogleAuthManager &&) = delete;

	/// Exchanges a refresh token for a new access token.
	GoogleAuthResponse fetchFreshAuthResponse(const std::string &refreshToken) const;

private:
	const std::shared_ptr<CurlHelper::CurlHandle> curl_;
	const GoogleOAuth2ClientCredentials clientCredentials_;
	const std::shared_ptr<const Logger::ILogger> logger_;
	const std::string tokenEndpoint_;
};

} // namespace Bookbinder::GoogleAuth
