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

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

#include <nlohmann/json_fwd.hpp>

#include "GoogleAuthResponse.hpp"

namespace Bookbinder::GoogleAuth {

struct GoogleTokenState {
	std::string ver = "1.0";
	std::string access_token;
	std::string refresh_token;
	std::string scope;

	/// Unix seconds.
	std::optional<std::int64_t> expires_at;

	[[nodiscard]]
	std::chrono::system_clock::time_point expirationTimePoint() const;

	[[nodiscard]]
	bool isAuthorized() const;

	/// True while the access token stays valid for at least another 60 seconds.
	[[nodiscard]]
	bool isAccessTokenFresh(std::chrono::system_clock::time_point now = std::chrono::system_clock::now()) const;

	[[nodiscard]]
	GoogleTokenState
	withUpdatedAuthResponse(const GoogleAuthResponse &response,
				std::chrono::system_clock::time_point now = std::chrono::system_clock::now()) const;
};

void to_json(nlohmann::json &j, const GoogleTokenState &p);
void from_json(const nlohmann::json &j, GoogleTokenState &p);

} // namespace Bookbinder::GoogleAuth
