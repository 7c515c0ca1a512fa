/*
 * SPDX-FileCopyrightText: Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 * SPDX-License-Identifier: MIT
 *
 * Bookbinder Logger Library
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
#include <ctime>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <source_location>
#include <span>
#include <stdexcept>
#include <string_view>

#include <fmt/chrono.h>
#include <fmt/format.h>

#include "ILogger.hpp"

namespace Bookbinder::Logger {

/**
 * Appends log lines to a file in the same key=value layout as PrintLogger,
 * prefixed with a UTC timestamp.
 */
class FileLogger final : public ILogger {
public:
	explicit FileLogger(const std::filesystem::path &path) : ofs_(path, std::ios::out | std::ios::app)
	{
		if (!ofs_.is_open()) {
			throw std::runtime_error("FileOpenError(FileLogger::FileLogger)");
		}
	}

	~FileLogger() noexcept override = default;

protected:
	void log(LogLevel level, std::string_view name, std::source_location loc,
		 std::span<const LogField> context) const noexcept override
	try {
		const std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());

		std::string line = fmt::format("time={:%Y-%m-%dT%H:%M:%SZ}\tlevel={}\tname={}\tlocation={}:{}",
					       fmt::gmtime(now), levelName(level), name, loc.file_name(),
					       loc.line());
		for (const auto &field : context) {
			fmt::format_to(std::back_inserter(line), "\t{}={}", field.key, field.value);
		}

		std::scoped_lock lock(mutex_);
		ofs_ << line << '\n';
		ofs_.flush();
	} catch (...) {
		// Logging must never throw into the caller.
	}

private:
	mutable std::mutex mutex_;
	mutable std::ofstream ofs_;
};

} // namespace Bookbinder::Logger
