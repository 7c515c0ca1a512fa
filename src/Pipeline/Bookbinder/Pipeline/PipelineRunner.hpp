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

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <Bookbinder/AudioCodec/IAudioCodec.hpp>
#include <Bookbinder/Discovery/PageDiscovery.hpp>
#include <Bookbinder/Logger/ILogger.hpp>

#include "Chunk.hpp"
#include "ChunkAcquirer.hpp"
#include "IStorageClient.hpp"
#include "PipelineState.hpp"
#include "RunContext.hpp"
#include "SegmentPacker.hpp"
#include "SegmentSummary.hpp"

namespace Bookbinder::Pipeline {

inline constexpr const char *kFailureReportFileName = "failed_downloads.txt";

struct RunnerOptions {
	std::filesystem::path outputDirectory = ".";
	std::string driveRootFolderName = "audiobooks";
	bool keepChunks = false;
	std::optional<std::string> titleOverride;
};

enum class FailureKind { None, Discovery, Acquisition, Export, Encoder, Io, Storage };

std::string_view toString(FailureKind kind) noexcept;

struct PipelineOutcome {
	PipelineState state = PipelineState::Idle;
	FailureKind failureKind = FailureKind::None;
	std::filesystem::path manifestPath;
	std::vector<SegmentSummary> segments;
	std::optional<std::filesystem::path> reportPath;

	[[nodiscard]]
	bool succeeded() const noexcept
	{
		return state == PipelineState::Done;
	}
};

/**
 * Drives one run from discovered URLs (or local chunks) to the manifest and,
 * when a storage client is given, to the remote folder.
 *
 * Failures are reported through the returned outcome rather than thrown. The
 * manifest is written in every case that reaches a book slug, and the
 * failure report is written whenever the run context holds failure records.
 */
class PipelineRunner {
public:
	PipelineRunner(std::shared_ptr<const ChunkAcquirer> acquirer, std::shared_ptr<const AudioCodec::IAudioCodec> codec,
		       std::shared_ptr<IStorageClient> storage, PackerOptions packerOptions, RunnerOptions options,
		       std::shared_ptr<const Logger::ILogger> logger);
	~PipelineRunner() noexcept;

	PipelineRunner(const PipelineRunner &) = delete;
	PipelineRunner &operator=(const PipelineRunner &) = delete;
	PipelineRunner(PipelineRunner &&) = delete;
	PipelineRunner &operator=(PipelineRunner &&) = delete;

	PipelineOutcome run(const Discovery::DiscoveryResult &discovery, RunContext &context) const;

	/// Packs chunks that are already on disk. The chunk files are never removed.
	PipelineOutcome runLocal(const std::string &title, const std::vector<Chunk> &chunks, RunContext &context) const;

private:
	struct Book {
		std::string title;
		std::string slug;
	};

	Book makeBook(const std::string &title) const;

	void acquireAndPack(const Discovery::DiscoveryResult &discovery, RunContext &context,
			    PipelineStateMachine &machine, PipelineOutcome &outcome) const;

	void packLocal(const std::string &title, const std::vector<Chunk> &chunks, RunContext &context,
		       PipelineStateMachine &machine, PipelineOutcome &outcome) const;

	/// From Acquiring onwards. `temporaryDirectory` is removed after a successful export when set.
	void packAndPublish(const Book &book, const std::vector<Chunk> &chunks,
			    const std::optional<std::filesystem::path> &temporaryDirectory, RunContext &context,
			    PipelineStateMachine &machine, PipelineOutcome &outcome) const;

	void publish(const Book &book, const PipelineOutcome &outcome) const;

	std::string findOrCreateFolder(const std::string &name, const std::optional<std::string> &parentId) const;

	void fail(PipelineStateMachine &machine, PipelineOutcome &outcome, FailureKind kind) const;

	/// Moves a run interrupted by an unexpected exception to Failed with FailureKind::Io. Never throws.
	void failUnexpected(PipelineStateMachine &machine, PipelineOutcome &outcome, const char *what) const noexcept;

	void writeEmptyManifest(const Book &book, PipelineOutcome &outcome) const;

	void finish(RunContext &context, PipelineStateMachine &machine, PipelineOutcome &outcome) const;

	const std::shared_ptr<const ChunkAcquirer> acquirer_;
	const std::shared_ptr<const AudioCodec::IAudioCodec> codec_;
	const std::shared_ptr<IStorageClient> storage_;
	const PackerOptions packerOptions_;
	const RunnerOptions options_;
	const std::shared_ptr<const Logger::ILogger> logger_;
};

} // namespace Bookbinder::Pipeline
