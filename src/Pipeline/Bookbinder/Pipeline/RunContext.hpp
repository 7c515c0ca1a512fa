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

#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace Bookbinder::Pipeline {

struct FailureRecord {
	std::string identifier;
	/// "N/A" when the failure has no originating URL.
	std::string url;
	std::string error;
};

struct RunStats {
	std::size_t totalChunks = 0;
	std::size_t successfulDownloads = 0;
	std::size_t failedDownloads = 0;
	std::uint64_t totalBytes = 0;
	std::size_t decodeFailures = 0;
};

/**
 * Accumulates the counters and failure records of one pipeline run. It is
 * passed explicitly to every stage. All members are guarded by one mutex so
 * concurrent fetch workers can record into it.
 */
class RunContext {
public:
	using Clock = std::chrono::system_clock;

	RunContext() = default;
	~RunContext() noexcept = default;

	RunContext(const RunContext &) = delete;
	RunContext &operator=(const RunContext &) = delete;
	RunContext(RunContext &&) = delete;
	RunContext &operator=(RunContext &&) = delete;

	void markStart(Clock::time_point now = Clock::now());
	void markEnd(Clock::time_point now = Clock::now());

	void setTotalChunks(std::size_t totalChunks);
	void recordDownload(std::uint64_t bytes);
	void recordDownloadFailure(FailureRecord record);
	void recordDecodeFailure(FailureRecord record);

	[[nodiscard]]
	RunStats stats() const;

	[[nodiscard]]
	std::vector<FailureRecord> failures() const;

	[[nodiscard]]
	bool hasFailures() const;

	[[nodiscard]]
	std::optional<Clock::time_point> startTime() const;

	[[nodiscard]]
	std::optional<Clock::time_point> endTime() const;

	/// Time between start and end, or between start and now while the run is in progress.
	[[nodiscard]]
	Clock::duration elapsed(Clock::time_point now = Clock::now()) const;

	/// Writes the flat text report. Throws std::runtime_error when the file cannot be written.
	void writeFailureReport(const std::filesystem::path &path, Clock::time_point now = Clock::now()) const;

private:
	mutable std::mutex mutex_;
	RunStats stats_;
	std::vector<FailureRecord> failures_;
	std::optional<Clock::time_point> startTime_;
	std::optional<Clock::time_point> endTime_;
};

} // namespace Bookbinder::Pipeline
