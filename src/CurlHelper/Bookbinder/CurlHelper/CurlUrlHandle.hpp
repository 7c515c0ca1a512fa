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

/**
 * RAII wrapper around the CURLU URL API, used for building request URLs and
 * resolving relative references against a base URL.
 */
class CurlUrlHandle {
public:
	CurlUrlHandle() : handle_(curl_url())
	{
		if (!handle_) {
			throw std::runtime_error("InitError(CurlUrlHandle::CurlUrlHandle)");
		}
	}

	~CurlUrlHandle() noexcept { curl_url_cleanup(handle_); }

	CurlUrlHandle(const CurlUrlHandle &) = delete;
	CurlUrlHandle &operator=(const CurlUrlHandle &) = delete;
	CurlUrlHandle(CurlUrlHandle &&) = delete;
	CurlUrlHandle &operator=(CurlUrlHandle &&) = delete;

	void setUrl(const std::string &url)
	{
		CURLUcode uc = curl_url_set(handle_, CURLUPART_URL, url.c_str(), 0);
		if (uc != CURLUE_OK) {
			throw std::runtime_error("UrlParseError(CurlUrlHandle::setUrl):" + url);
		}
	}

	/// Applies `reference` on top of the current URL. Relative references are
	/// resolved against it, absolute ones replace it.
	void resolve(const std::string &reference)
	{
		CURLUcode uc = curl_url_set(handle_, CURLUPART_URL, reference.c_str(), CURLU_NON_SUPPORT_SCHEME);
		if (uc != CURLUE_OK) {
			throw std::runtime_error("UrlResolveError(CurlUrlHandle::resolve):" + reference);
		}
	}

	void appendQuery(const std::string &query)
	{
		CURLUcode uc = curl_url_set(handle_, CURLUPART_QUERY, query.c_str(), CURLU_APPENDQUERY);
		if (uc != CURLUE_OK) {
			throw std::runtime_error("QueryAppendError(CurlUrlHandle::appendQuery):" + query);
		}
	}

	[[nodiscard]]
	std::string getUrl() const
	{
		return getPart(CURLUPART_URL);
	}

	[[nodiscard]]
	std::string getHost() const
	{
		return getPart(CURLUPART_HOST);
	}

	[[nodiscard]]
	std::string getPath(bool urlDecode = false) const
	{
		return getPart(CURLUPART_PATH, urlDecode ? CURLU_URLDECODE : 0);
	}

private:
	std::string getPart(CURLUPart part, unsigned int flags = 0) const
	{
		char *raw = nullptr;
		CURLUcode uc = curl_url_get(handle_, part, &raw, flags);
		if (uc != CURLUE_OK || !raw) {
			throw std::runtime_error("GetUrlError(CurlUrlHandle::getPart)");
		}
		std::unique_ptr<char, decltype(&curl_free)> guard(raw, curl_free);
		return std::string(guard.get());
	}

	CURLU *const handle_;
};

} // namespace Bookbinder::CurlHelper
