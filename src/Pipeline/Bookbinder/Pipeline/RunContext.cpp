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

#include "RunContext.hpp"

#include <fstream>
#include <stdexcept>
#include <utility>

#include "IsoTime.hpp"

namespace Bookbinder::Pipeline {

void RunContext::markStart(Clock::time_point now)
{
	std::scoped_lock lock(mutex_);
	startTime_ = now;
	endTime_.reset();
}

void RunContext::markEnd(Clock::time_point now)
{
	std::scoped_lock lock(mutex_);
	endTime_ = now;
}

void RunContext::setTotalChunks(std::size_t totalChunks)
{
	std::scoped_lock lock(mutex_);
	stats_.totalChunks = totalChunks;
}

void RunContext::recordDownload(std::uint64_t bytes)
{
	std::scoped_lock lock(mutex_);
	stats_.successfulDownloads++;
	stats_.totalBytes += bytes;
}

void RunContext::recordDownloadFailure(FailureRecord record)
{
	std::scoped_lock lock(mutex_);
	stats_.failedDownloads++;
	failures_.push_back(std::move(record));
}

void RunContext::recordDecodeFailure(FailureRecord record)
{
	std::scoped_lock lock(mutex_);
	stats_.decodeFailures++;
	failures_.push_back(std::move(record));
}

RunStats RunContext::stats() const
{
	std::scoped_lock lock(mutex_);
	return stats_;
}

std::vector<FailureRecord> RunContext::failures() const
{
	std::scoped_lock lock(mutex_);
	return failures_;
}

bool RunContext::hasFailures() const
{
	std::scoped_lock lock(mutex_);
	return !failures_.empty();
}

std::optional<RunContext::Clock::time_point> RunContext::startTime() const
{
	std::scoped_lock lock(mutex_);
	return startTime_;
}

std::optional<RunContext::Clock::time_point> RunContext::endTime() const
{
	std::scoped_lock lock(mutex_);
	return endTime_;
}

RunContext::Clock::duration RunContext::elapsed(Clock::time_point now) const
{
	std::scoped_lock lock(mutex_);
	if (!startTime_.has_value()) {
		return Clock::duration::zero();
	}
	return endTime_.value_or(now) - *startTime_;
}

void RunContext::writeFailureReport(const std::filesystem::path &path, Clock::time_point now) const
{
	std::vector<FailureRecord> records = failures();

	std::ofstream ofs(path, std::ios::out | std::ios::trunc);
	if (!ofs.is_open()) {
		throw std::runtime_error("FileOpenError(RunContext::writeFailureReport):" + path.string());
	}

	ofs << "Bookbinder - Failed Downloads Report\n";
	ofs << "Generated: " << formatIsoUtc(now) << "\n\n";

	for (const auto &record : records) {
		ofs << "File: " << record.identifier << "\n";
		ofs << "URL: " << (record.url.empty() ? "N/A" : record.url) << "\n";
		ofs << "Error: " << record.error << "\n\n";
	}

	ofs.close();
	if (ofs.fail()) {
		throw std::runtime_error("FileWriteError(RunContext::writeFailureReport):" + path.string());
	}
}

} // namespace Bookbinder::Pipeline
