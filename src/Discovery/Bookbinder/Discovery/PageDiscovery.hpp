/*
 * SPDX-FileCopyrightText: Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 * SPDX-License-Identifier: MIT
 *
 * Bookbinder Discovery Library
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

#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include <Bookbinder/CurlHelper/CurlHandle.hpp>
#include <Bookbinder/Logger/ILogger.hpp>

namespace Bookbinder::Discovery {

struct DiscoveryResult {
	std::string title;
	std::vector<std::string> urls;
};

/// Returns the `src` values of `<audio>` elements and of `<source>` elements nested in them, in document order.
std::vector<std::string> extractAudioSources(std::string_view html);

/**
 * Resolves references against `baseUrl`, drops those whose host does not
 * contain `hostFilter` (when non-empty) and removes duplicates, keeping the
 * first occurrence.
 */
std::vector<std::string> normalizeUrls(const std::vector<std::string> &sources, const std::string &baseUrl,
				       std::string_view hostFilter);

/// Reads one URL per line. Blank lines and lines starting with '#' are skipped.
std::vector<std::string> readUrlList(const std::filesystem::path &path);

/// Builds a result whose title is derived from the first URL.
DiscoveryResult makeDiscoveryResult(std::vector<std::string> urls);

class PageDiscovery {
public:
	PageDiscovery(std::shared_ptr<CurlHelper::CurlHandle> curl, std::shared_ptr<const Logger::ILogger> logger,
		      std::string hostFilter = {});
	~PageDiscovery() noexcept;

	PageDiscovery(const PageDiscovery &) = delete;
	PageDiscovery &operator=(const PageDiscovery &) = delete;
	PageDiscovery(PageDiscovery &&) = delete;
	PageDiscovery &operator=(PageDiscovery &&) = delete;

	/// Network and HTTP errors are logged and yield an empty result.
	DiscoveryResult discover(const std::string &pageUrl) const;

private:
	const std::shared_ptr<CurlHelper::CurlHandle> curl_;
	const std::shared_ptr<const Logger::ILogger> logger_;
	const std::string hostFilter_;
};

} // namespace Bookbinder::Discovery
