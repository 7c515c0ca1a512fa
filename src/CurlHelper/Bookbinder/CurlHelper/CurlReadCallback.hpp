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

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <fstream>
#include <limits>

#include <curl/curl.h>

namespace Bookbinder::CurlHelper {

/// Body of a streamed upload. `bytesSent` counts what curl has consumed so far.
struct CurlFileReadSource {
	std::ifstream stream;
	std::uintmax_t bytesSent = 0;
};

/// CURLOPT_READFUNCTION over a CurlFileReadSource. A stream error aborts the transfer.
inline std::size_t CurlFileReadCallback(char *buffer, std::size_t size, std::size_t nmemb, void *userp) noexcept
{
	if (size != 0 && nmemb > (std::numeric_limits<std::size_t>::max() / size)) {
		return CURL_READFUNC_ABORT;
	}

	auto *source = static_cast<CurlFileReadSource *>(userp);
	if (!source || source->stream.bad()) {
		return CURL_READFUNC_ABORT;
	}

	constexpr auto kMaxRead = static_cast<std::size_t>(std::numeric_limits<std::streamsize>::max());
	const std::size_t requested = std::min(size * nmemb, kMaxRead);
	if (requested == 0 || source->stream.eof()) {
		return 0;
	}

	source->stream.read(buffer, static_cast<std::streamsize>(requested));
	if (source->stream.bad()) {
		return CURL_READFUNC_ABORT;
	}

	const auto got = static_cast<std::size_t>(source->stream.gcount());
	source->bytesSent += got;
	return got;
}

} // namespace Bookbinder::CurlHelper
