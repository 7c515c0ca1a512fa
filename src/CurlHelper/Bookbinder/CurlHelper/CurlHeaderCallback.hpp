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
#include <cctype>
#include <cstddef>
#include <limits>
#include <map>
#include <string>

#include <curl/curl.h>

namespace Bookbinder::CurlHelper {

/// Response headers keyed by lower-cased name. A repeated header keeps its last value.
using CurlHeaderMap = std::map<std::string, std::string>;

inline std::size_t CurlHeaderMapCallback(char *buffer, std::size_t size, std::size_t nitems, void *userp) noexcept
{
	if (size != 0 && nitems > (std::numeric_limits<std::size_t>::max() / size)) {
		return 0;
	}

	std::size_t totalSize = size * nitems;

	try {
		auto *headers = static_cast<CurlHeaderMap *>(userp);
		std::string line(buffer, totalSize);

		auto colon = line.find(':');
		if (colon == std::string::npos) {
			// Status line or the blank line that ends a header block.
			if (line.rfind("HTTP/", 0) == 0) {
				headers->clear();
			}
			return totalSize;
		}

		std::string name = line.substr(0, colon);
		std::transform(name.begin(), name.end(), name.begin(),
			       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

		std::string value = line.substr(colon + 1);
		auto first = value.find_first_not_of(" \t");
		auto last = value.find_last_not_of(" \t\r\n");
		value = (first == std::string::npos) ? std::string() : value.substr(first, last - first + 1);

		(*headers)[name] = value;
	} catch (...) {
		return 0;
	}

	return totalSize;
}

} // namespace Bookbinder::CurlHelper
