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

#include "PageDiscovery.hpp"

#include <algorithm>
#include <fstream>
#include <regex>
#include <stdexcept>
#include <unordered_set>
#include <utility>

#include <Bookbinder/CurlHelper/CurlUrlHandle.hpp>
#include <Bookbinder/CurlHelper/CurlWriteCallback.hpp>

#include "BookNaming.hpp"

namespace Bookbinder::Discovery {

namespace {

std::string decodeBasicEntities(std::string value)
{
	static const std::pair<const char *, const char *> entities[] = {
		{"&amp;", "&"}, {"&quot;", "\""}, {"&#39;", "'"}, {"&lt;", "<"}, {"&gt;", ">"}};

	for (const auto &[entity, replacement] : entities) {
		std::string::size_type pos = 0;
		const std::string_view e(entity);
		while ((pos = value.find(e, pos)) != std::string::npos) {
			value.replace(pos, e.size(), replacement);
			pos += 1;
		}
	}
	return value;
}

std::string trim(const std::string &s)
{
	auto first = s.find_first_not_of(" \t\r\n");
	if (first == std::string::npos)
		return {};
	auto last = s.find_last_not_of(" \t\r\n");
	return s.substr(first, last - first + 1);
}

} // anonymous namespace

std::vector<std::string> extractAudioSources(std::string_view html)
{
	static const std::regex tagPattern(R"(<(/?)(audio|source)\b([^>]*)>)", std::regex::icase);
	static const std::regex srcPattern(R"re((?:^|\s)src\s*=\s*(?:"([^"]*)"|'([^']*)'|([^\s"'>]+)))re",
					   std::regex::icase);

	std::vector<std::string> sources;
	int audioDepth = 0;

	const std::string text(html);
	for (auto it = std::sregex_iterator(text.begin(), text.end(), tagPattern); it != std::sregex_iterator();
	     ++it) {
		const std::smatch &tag = *it;
		const bool closing = tag[1].length() > 0;
		std::string name = tag[2].str();
		std::transform(name.begin(), name.end(), name.begin(),
			       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

		const std::string attributes = tag[3].str();

		if (name == "audio") {
			if (closing) {
				audioDepth = std::max(0, audioDepth - 1);
				continue;
			}
			// A self-closing <audio .../> has no children.
			const bool selfClosing = !attributes.empty() && attributes.back() == '/';
			if (!selfClosing) {
				++audioDepth;
			}
		} else if (closing || audioDepth == 0) {
			continue;
		}

		std::smatch src;
		if (!std::regex_search(attributes, src, srcPattern))
			continue;

		std::string value;
		for (int group = 1; group <= 3; ++group) {
			if (src[group].matched) {
				value = src[group].str();
				break;
			}
		}

		value = trim(decodeBasicEntities(value));
		if (!value.empty()) {
			sources.push_back(std::move(value));
		}
	}

	return sources;
}

std::vector<std::string> normalizeUrls(const std::vector<std::string> &sources, const std::string &baseUrl,
				       std::string_view hostFilter)
{
	std::vector<std::string> urls;
	std::unordered_set<std::string> seen;

	for (const auto &source : sources) {
		std::string resolved;
		std::string host;
		try {
			CurlHelper::CurlUrlHandle url;
			if (!baseUrl.empty()) {
				url.setUrl(baseUrl);
				url.resolve(source);
			} else {
				url.setUrl(source);
			}
			resolved = url.getUrl();
			host = url.getHost();
		} catch (const std::runtime_error &) {
			continue;
		}

		if (!hostFilter.empty() && host.find(hostFilter) == std::string::npos)
			continue;

		if (seen.insert(resolved).second) {
			urls.push_back(std::move(resolved));
		}
	}

	return urls;
}

std::vector<std::string> readUrlList(const std::filesystem::path &path)
{
	std::ifstream ifs(path);
	if (!ifs.is_open()) {
		throw std::runtime_error("FileOpenError(readUrlList):" + path.string());
	}

	std::vector<std::string> urls;
	std::string line;
	while (std::getline(ifs, line)) {
		std::string url = trim(line);
		if (url.empty() || url.front() == '#')
			continue;
		urls.push_back(std::move(url));
	}
	return urls;
}

DiscoveryResult makeDiscoveryResult(std::vector<std::string> urls)
{
	DiscoveryResult result;
	result.title = urls.empty() ? std::string(kUnknownBookTitle) : deriveBookTitle(urls.front());
	result.urls = std::move(urls);
	return result;
}

PageDiscovery::PageDiscovery(std::shared_ptr<CurlHelper::CurlHandle> curl,
			     std::shared_ptr<const Logger::ILogger> logger, std::string hostFilter)
	: curl_(curl ? std::move(curl) : throw std::invalid_argument("CurlIsNullError(PageDiscovery::PageDiscovery)")),
	  logger_(logger ? std::move(logger) : throw std::invalid_argument("LoggerIsNullError(PageDiscovery::PageDiscovery)")),
	  hostFilter_(std::move(hostFilter))
{
}

PageDiscovery::~PageDiscovery() noexcept = default;

DiscoveryResult PageDiscovery::discover(const std::string &pageUrl) const
{
	logger_->info("DiscoveringAudioSources", {{"url", pageUrl}});

	CURL *curl = curl_->get();
	std::vector<char> body;

	CurlHelper::TransferLimits limits;
	limits.totalTimeoutSeconds = 30;
	limits.maxRedirects = 5;
	curl_->prepare(limits);

	curl_easy_setopt(curl, CURLOPT_URL, pageUrl.c_str());
	curl_easy_setopt(curl, CURLOPT_FAILONERROR, 1L);

	curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, CurlHelper::CurlCharVectorWriteCallback);
	curl_easy_setopt(curl, CURLOPT_WRITEDATA, &body);

	CURLcode res = curl_easy_perform(curl);
	if (res != CURLE_OK) {
		logger_->error("PageFetchError", {{"url", pageUrl},
						  {"error", curl_easy_strerror(res)},
						  {"status", std::to_string(curl_->responseCode())}});
		return {};
	}

	// Relative sources resolve against the final URL after redirects.
	std::string baseUrl = curl_->effectiveUrl();
	if (baseUrl.empty()) {
		baseUrl = pageUrl;
	}

	std::vector<std::string> sources = extractAudioSources(std::string_view(body.data(), body.size()));
	std::vector<std::string> urls = normalizeUrls(sources, baseUrl, hostFilter_);

	for (const auto &url : urls) {
		logger_->debug("FoundAudioUrl", {{"url", url}});
	}

	if (urls.empty()) {
		logger_->warn("NoAudioSourcesFound", {{"url", pageUrl}, {"candidates", std::to_string(sources.size())}});
		return {};
	}

	DiscoveryResult result = makeDiscoveryResult(std::move(urls));
	logger_->info("DiscoveredAudioSources",
		      {{"title", result.title}, {"count", std::to_string(result.urls.size())}});
	return result;
}

} // namespace Bookbinder::Discovery
