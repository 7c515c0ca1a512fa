/*
 * SPDX-FileCopyrightText: Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 * SPDX-License-Identifier: MIT
 *
 * Bookbinder Pipeline Library
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

#include "CurlChunkFetcher.hpp"

#include <fstream>
#include <stdexcept>
#include <system_error>
#include <utility>

#include <fmt/format.h>

#include <Bookbinder/CurlHelper/CurlHandle.hpp>
#include <Bookbinder/CurlHelper/CurlWriteCallback.hpp>

#include "PipelineErrors.hpp"

namespace Bookbinder::Pipeline {

namespace {

void removePartial(const std::filesystem::path &destination)
{
	std::error_code ec;
	std::filesystem::remove(destination, ec);
}

} // anonymous namespace

CurlChunkFetcher::CurlChunkFetcher(std::shared_ptr<const Logger::ILogger> logger)
	: logger_(logger ? std::move(logger) : throw std::invalid_argument("LoggerIsNullError(CurlChunkFetcher::CurlChunkFetcher)"))
{
}

CurlChunkFetcher::~CurlChunkFetcher() noexcept = default;

std::uint64_t CurlChunkFetcher::fetch(const std::string &url, const std::filesystem::path &destination) const
{
	const CurlHelper::CurlHandle curlHandle;
	CURL *curl = curlHandle.get();

	std::ofstream ofs(destination, std::ios::binary | std::ios::trunc);
	if (!ofs.is_open()) {
		logger_->error("FileOpenError", {{"path", destination.string()}});
		throw FetchError("FileOpenError(CurlChunkFetcher::fetch):" + destination.string());
	}

	std::ostream *stream = &ofs;

	CurlHelper::TransferLimits limits;
	limits.totalTimeoutSeconds = 60;
	limits.maxRedirects = 5;
	curlHandle.prepare(limits);

	curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
	curl_easy_setopt(curl, CURLOPT_FAILONERROR, 1L);

	curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, CurlHelper::CurlOstreamWriteCallback);
	curl_easy_setopt(curl, CURLOPT_WRITEDATA, stream);

	CURLcode res = curl_easy_perform(curl);
	ofs.close();

	if (res != CURLE_OK) {
		removePartial(destination);
		throw FetchError(fmt::format("{} (HTTP {})", curl_easy_strerror(res), curlHandle.responseCode()));
	}

	if (ofs.fail()) {
		removePartial(destination);
		logger_->error("FileWriteError", {{"path", destination.string()}});
		throw FetchError("FileWriteError(CurlChunkFetcher::fetch):" + destination.string());
	}

	std::error_code ec;
	const auto size = std::filesystem::file_size(destination, ec);
	if (ec) {
		removePartial(destination);
		throw FetchError("FileSizeError(CurlChunkFetcher::fetch):" + ec.message());
	}
	return size;
}

} // namespace Bookbinder::Pipeline
