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
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <Bookbinder/Logger/ILogger.hpp>

#include "Chunk.hpp"
#include "IChunkFetcher.hpp"
#include "RunContext.hpp"

namespace Bookbinder::Pipeline {

struct AcquirerOptions {
	int retryCount = 3;
	std::chrono::milliseconds retryDelay = std::chrono::seconds(2);
	int concurrency = 1;
	std::string extension = "mp3";
};

class ChunkAcquirer {
public:
	ChunkAcquirer(std::shared_ptr<const IChunkFetcher> fetcher, AcquirerOptions options,
		      std::shared_ptr<const Logger::ILogger> logger);
	~ChunkAcquirer() noexcept;

	ChunkAcquirer(const ChunkAcquirer &) = delete;
	ChunkAcquirer &operator=(const ChunkAcquirer &) = delete;
	ChunkAcquirer(ChunkAcquirer &&) = delete;
	ChunkAcquirer &operator=(ChunkAcquirer &&) = delete;

	/**
	 * Fetches every URL into `directory`, up to `concurrency` at a time. A URL
	 * that still fails after `retryCount` attempts is recorded in `context` and
	 * left out. The returned chunks are in URL order with dense sequence indices.
	 */
	std::vector<Chunk> acquire(const std::vector<std::string> &urls, const std::filesystem::path &directory,
				   RunContext &context) const;

	[[nodiscard]]
	const AcquirerOptions &options() const noexcept
	{
		return options_;
	}

private:
	std::optional<Chunk> acquireOne(int remoteIndex, const std::string &url, const std::filesystem::path &directory,
					RunContext &context) const;

	const std::shared_ptr<const IChunkFetcher> fetcher_;
	const AcquirerOptions options_;
	const std::shared_ptr<const Logger::ILogger> logger_;
};

} // namespace Bookbinder::Pipeline
