/*
 * SPDX-FileCopyrightText: Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 * SPDX-License-Identifier: MIT
 *
 * Bookbinder CurlHelper Library
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
#include <stdexcept>
#include <string>

#include <curl/curl.h>

namespace Bookbinder::CurlHelper {

/// Limits applied to every transfer. Zero disables the total timeout or the stall detection.
struct TransferLimits {
	long connectTimeoutSeconds = 10;
	long totalTimeoutSeconds = 0;
	long stallSeconds = 0;
	long maxRedirects = 0;
};

/**
 * Owns one easy handle. Each worker thread that performs transfers keeps its own.
 */
class CurlHandle {
	[[nodiscard]]
	static auto createCurlHandle()
	{
		CURL *curl = curl_easy_init();
		if (!curl)
			throw std::runtime_error("CurlInitError(CurlHandle::createCurlHandle)");
		return std::unique_ptr<CURL, decltype(&curl_easy_cleanup)>(curl, &curl_easy_cleanup);
	}

public:
	CurlHandle() : curl_(createCurlHandle()) {}

	~CurlHandle() noexcept = default;

	CurlHandle(const CurlHandle &) = delete;
	CurlHandle &operator=(const CurlHandle &) = delete;
	CurlHandle(CurlHandle &&) = delete;
	CurlHandle &operator=(CurlHandle &&) = delete;

	[[nodiscard]]
	CURL *get() const noexcept
	{
		return curl_.get();
	}

	/// Drops every option of the previous transfer, then applies `limits`.
	void prepare(const TransferLimits &limits) const noexcept
	{
		CURL *curl = curl_.get();
		curl_easy_reset(curl);

		// Worker threads must not receive SIGALRM from the resolver.
		curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
		curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, limits.connectTimeoutSeconds);

		if (limits.totalTimeoutSeconds > 0) {
			curl_easy_setopt(curl, CURLOPT_TIMEOUT, limits.totalTimeoutSeconds);
		}
		if (limits.stallSeconds > 0) {
			curl_easy_setopt(curl, CURLOPT_LOW_SPEED_LIMIT, 1L);
			curl_easy_setopt(curl, CURLOPT_LOW_SPEED_TIME, limits.stallSeconds);
		}
		if (limits.maxRedirects > 0) {
			curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
			curl_easy_setopt(curl, CURLOPT_MAXREDIRS, limits.maxRedirects);
		}
	}

	/// HTTP status of the last transfer, or 0 when no response arrived.
	[[nodiscard]]
	long responseCode() const noexcept
	{
		long status = 0;
		if (curl_easy_getinfo(curl_.get(), CURLINFO_RESPONSE_CODE, &status) != CURLE_OK) {
			return 0;
		}
		return status;
	}

	/// URL of the last transfer after redirects, or empty when unknown.
	[[nodiscard]]
	std::string effectiveUrl() const
	{
		char *url = nullptr;
		if (curl_easy_getinfo(curl_.get(), CURLINFO_EFFECTIVE_URL, &url) != CURLE_OK || !url) {
			return {};
		}
		return url;
	}

private:
	std::unique_ptr<CURL, decltype(&curl_easy_cleanup)> curl_;
};

} // namespace Bookbinder::CurlHelper
