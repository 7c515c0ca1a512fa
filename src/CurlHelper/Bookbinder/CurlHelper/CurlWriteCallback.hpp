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

#include <concepts>
#include <cstddef>
#include <limits>
#include <ostream>
#include <vector>

#include <curl/curl.h>

namespace Bookbinder::CurlHelper {

template<typename T>
concept SingleByte = sizeof(T) == 1;

template<SingleByte T>
inline std::size_t CurlVectorWriteCallback(void *contents, std::size_t size, std::size_t nmemb, void *userp) noexcept
{
	if (size != 0 && nmemb > (std::numeric_limits<std::size_t>::max() / size)) {
		return CURL_WRITEFUNC_ERROR;
	}

	std::size_t totalSize = size * nmemb;

	try {
		auto *vec = static_cast<std::vector<T> *>(userp);

		const auto *start = static_cast<const T *>(contents);
		vec->insert(vec->end(), start, start + totalSize);
	} catch (...) {
		return CURL_WRITEFUNC_ERROR;
	}

	return totalSize;
}

inline std::size_t CurlCharVectorWriteCallback(void *contents, std::size_t size, std::size_t nmemb,
					       void *userp) noexcept
{
	return CurlVectorWriteCallback<char>(contents, size, nmemb, userp);
}

/**
 * Streams the body straight into an std::ostream (usually an std::ofstream)
 * so that large audio chunks never sit in memory.
 */
inline std::size_t CurlOstreamWriteCallback(void *contents, std::size_t size, std::size_t nmemb, void *userp) noexcept
{
	if (size != 0 && nmemb > (std::numeric_limits<std::size_t>::max() / size)) {
		return CURL_WRITEFUNC_ERROR;
	}

	std::size_t totalSize = size * nmemb;
	if (totalSize > static_cast<std::size_t>(std::numeric_limits<std::streamsize>::max())) {
		return CURL_WRITEFUNC_ERROR;
	}

	try {
		auto *stream = static_cast<std::ostream *>(userp);
		if (!stream || !(*stream)) {
			return CURL_WRITEFUNC_ERROR;
		}

		stream->write(static_cast<const char *>(contents), static_cast<std::streamsize>(totalSize));
		if (!(*stream)) {
			return CURL_WRITEFUNC_ERROR;
		}
	} catch (...) {
		return CURL_WRITEFUNC_ERROR;
	}

	return totalSize;
}

} // namespace Bookbinder::CurlHelper
