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

#include "PipelineRunner.hpp"

#include <chrono>
#include <stdexcept>
#include <system_error>
#include <utility>

#include <fmt/format.h>

#include <Bookbinder/Discovery/BookNaming.hpp>

#include "Manifest.hpp"
#include "PipelineErrors.hpp"

namespace Bookbinder::Pipeline {

namespace {

constexpr const char *kUnknownBookFolderName = "Unknown_Book";

} // anonymous namespace

std::string_view toString(FailureKind kind) noexcept
{
	switch (kind) {
	case FailureKind::None:
		return "None";
	case FailureKind::Discovery:
		return "Discovery";
	case FailureKind::Acquisition:
		return "Acquisition";
	case FailureKind::Export:
		return "Export";
	case FailureKind::Encoder:
		return "Encoder";
	case FailureKind::Io:
		return "Io";
	case FailureKind::Storage:
		return "Storage";
	}
	return "Unknown";
}

PipelineRunner::PipelineRunner(std::shared_ptr<const ChunkAcquirer> acquirer,
			       std::shared_ptr<const AudioCodec::IAudioCodec> codec, std::shared_ptr<IStorageClient> storage,
			       PackerOptions packerOptions, RunnerOptions options,
			       std::shared_ptr<const Logger::ILogger> logger)
	: acquirer_(std::move(acquirer)),
	  codec_(codec ? std::move(codec) : throw std::invalid_argument("CodecIsNullError(PipelineRunner::PipelineRunner)")),
	  storage_(std::move(storage)),
	  packerOptions_(std::move(packerOptions)),
	  options_(std::move(options)),
	  logger_(logger ? std::move(logger)
			 : throw std::invalid_argument("LoggerIsNullError(PipelineRunner::PipelineRunner)"))
{
}

PipelineRunner::~PipelineRunner() noexcept = default;

PipelineOutcome PipelineRunner::run(const Discovery::DiscoveryResult &discovery, RunContext &context) const
{
	if (!acquirer_) {
		throw std::logic_error("AcquirerIsNullError(PipelineRunner::run)");
	}

	context.markStart();
	PipelineStateMachine machine(logger_);
	PipelineOutcome outcome;

	try {
		acquireAndPack(discovery, context, machine, outcome);
	} catch (const std::exception &e) {
		failUnexpected(machine, outcome, e.what());
	}

	finish(context, machine, outcome);
	return outcome;
}

PipelineOutcome PipelineRunner::runLocal(const std::string &title, const std::vector<Chunk> &chunks,
					 RunContext &context) const
{
	context.markStart();
	PipelineStateMachine machine(logger_);
	PipelineOutcome outcome;

	try {
		packLocal(title, chunks, context, machine, outcome);
	} catch (const std::exception &e) {
		failUnexpected(machine, outcome, e.what());
	}

	finish(context, machine, outcome);
	return outcome;
}

void PipelineRunner::acquireAndPack(const Discovery::DiscoveryResult &discovery, RunContext &context,
				    PipelineStateMachine &machine, PipelineOutcome &outcome) const
{
	const Book book = makeBook(options_.titleOverride.value_or(discovery.title));
	context.setTotalChunks(discovery.urls.size());
	logger_->info("RunStarted", {{"title", book.title},
				     {"slug", book.slug},
				     {"urls", std::to_string(discovery.urls.size())}});

	machine.transitionTo(PipelineState::Acquiring);

	if (discovery.urls.empty()) {
		logger_->error("DiscoveryFailed", {{"title", book.title}});
		writeEmptyManifest(book, outcome);
		fail(machine, outcome, FailureKind::Discovery);
		return;
	}

	const std::filesystem::path temporaryDirectory = options_.outputDirectory / ("temp_" + book.slug);
	std::vector<Chunk> chunks;
	try {
		std::filesystem::create_directories(temporaryDirectory);
		chunks = acquirer_->acquire(discovery.urls, temporaryDirectory, context);
	} catch (const std::filesystem::filesystem_error &e) {
		logger_->error("ChunkDirectoryError", {{"path", temporaryDirectory.string()}, {"what", e.what()}});
		fail(machine, outcome, FailureKind::Io);
		return;
	}

	if (chunks.empty()) {
		logger_->error("AcquisitionFailed", {{"urls", std::to_string(discovery.urls.size())}});
		writeEmptyManifest(book, outcome);
		fail(machine, outcome, FailureKind::Acquisition);
		return;
	}

	packAndPublish(book, chunks, temporaryDirectory, context, machine, outcome);
}

void PipelineRunner::packLocal(const std::string &title, const std::vector<Chunk> &chunks, RunContext &context,
			       PipelineStateMachine &machine, PipelineOutcome &outcome) const
{
	const Book book = makeBook(options_.titleOverride.value_or(title));
	context.setTotalChunks(chunks.size());
	for (const Chunk &chunk : chunks) {
		context.recordDownload(chunk.byteSize());
	}
	logger_->info("LocalRunStarted", {{"title", book.title},
					  {"slug", book.slug},
					  {"chunks", std::to_string(chunks.size())}});

	machine.transitionTo(PipelineState::Acquiring);

	if (chunks.empty()) {
		logger_->error("NoLocalChunks", {{"title", book.title}});
		writeEmptyManifest(book, outcome);
		fail(machine, outcome, FailureKind::Acquisition);
		return;
	}

	packAndPublish(book, chunks, std::nullopt, context, machine, outcome);
}

PipelineRunner::Book PipelineRunner::makeBook(const std::string &title) const
{
	Book book;
	// Titles derived from URLs may carry undecodable bytes, which the manifest cannot serialize.
	book.title = Discovery::toValidUtf8(title);
	if (book.title.empty()) {
		book.title = Discovery::kUnknownBookTitle;
	}
	book.slug = Discovery::makeBookSlug(book.title);
	if (book.slug.empty()) {
		book.slug = Discovery::makeBookSlug(Discovery::kUnknownBookTitle);
	}
	return book;
}

void PipelineRunner::packAndPublish(const Book &book, const std::vector<Chunk> &chunks,
				    const std::optional<std::filesystem::path> &temporaryDirectory,
				    RunContext &context, PipelineStateMachine &machine, PipelineOutcome &outcome) const
{
	machine.transitionTo(PipelineState::Packing);

	bool encoderAvailable = false;
	try {
		encoderAvailable = codec_->isAvailable();
	} catch (const std::exception &e) {
		logger_->error("EncoderCheckFailed", {{"what", e.what()}});
	}
	if (!encoderAvailable) {
		logger_->error("EncoderUnavailable");
		fail(machine, outcome, FailureKind::Encoder);
		return;
	}

	PackerOptions packerOptions = packerOptions_;
	packerOptions.outputDirectory = options_.outputDirectory;
	packerOptions.bookSlug = book.slug;

	try {
		std::filesystem::create_directories(options_.outputDirectory);
		const SegmentPacker packer(codec_, std::move(packerOptions), logger_);
		outcome.segments = packer.pack(chunks, context);
	} catch (const ExportError &e) {
		logger_->error("SegmentExportFailed", {{"what", e.what()}});
		fail(machine, outcome, FailureKind::Export);
		return;
	} catch (const std::filesystem::filesystem_error &e) {
		logger_->error("PackingIoError", {{"what", e.what()}});
		fail(machine, outcome, FailureKind::Io);
		return;
	}

	const Manifest manifest = ManifestBuilder::build(book.title, outcome.segments);
	outcome.manifestPath = manifestPathFor(options_.outputDirectory, book.slug);
	try {
		writeManifest(manifest, outcome.manifestPath);
	} catch (const std::exception &e) {
		logger_->error("ManifestWriteFailed", {{"path", outcome.manifestPath.string()}, {"what", e.what()}});
		fail(machine, outcome, FailureKind::Io);
		return;
	}
	logger_->info("ManifestWritten", {{"path", outcome.manifestPath.string()},
					  {"segments", std::to_string(manifest.totalSegments())}});
	machine.transitionTo(PipelineState::ManifestBuilt);

	if (temporaryDirectory && !options_.keepChunks) {
		std::error_code ec;
		std::filesystem::remove_all(*temporaryDirectory, ec);
		if (ec) {
			logger_->warn("ChunkDirectoryRemoveFailed",
				      {{"path", temporaryDirectory->string()}, {"error", ec.message()}});
		} else {
			logger_->info("ChunkDirectoryRemoved", {{"path", temporaryDirectory->string()}});
		}
	}

	if (!storage_) {
		machine.transitionTo(PipelineState::Done);
		return;
	}

	machine.transitionTo(PipelineState::Publishing);
	try {
		publish(book, outcome);
	} catch (const StorageError &e) {
		logger_->error("PublishingFailed", {{"what", e.what()}});
		fail(machine, outcome, FailureKind::Storage);
		return;
	}
	machine.transitionTo(PipelineState::Done);
}

void PipelineRunner::publish(const Book &book, const PipelineOutcome &outcome) const
{
	const std::string rootId = findOrCreateFolder(options_.driveRootFolderName, std::nullopt);

	std::string folderName = Discovery::makeSafeFolderName(book.title);
	if (folderName.empty()) {
		folderName = kUnknownBookFolderName;
	}
	const std::string bookFolderId = findOrCreateFolder(folderName, rootId);

	for (const SegmentSummary &segment : outcome.segments) {
		const std::string fileId = storage_->upload(segment.file, bookFolderId, segment.fileName);
		logger_->info("SegmentUploaded", {{"file", segment.fileName}, {"id", fileId}});
	}

	const std::string manifestName = outcome.manifestPath.filename().string();
	const std::string manifestId = storage_->upload(outcome.manifestPath, bookFolderId, manifestName);
	logger_->info("ManifestUploaded", {{"file", manifestName}, {"id", manifestId}, {"folder", folderName}});
}

std::string PipelineRunner::findOrCreateFolder(const std::string &name,
					       const std::optional<std::string> &parentId) const
{
	if (std::optional<std::string> existing = storage_->findFolder(name, parentId)) {
		logger_->info("RemoteFolderFound", {{"name", name}, {"id", *existing}});
		return *existing;
	}

	std::string created = storage_->createFolder(name, parentId);
	logger_->info("RemoteFolderCreated", {{"name", name}, {"id", created}});
	return created;
}

void PipelineRunner::fail(PipelineStateMachine &machine, PipelineOutcome &outcome, FailureKind kind) const
{
	outcome.failureKind = kind;
	machine.transitionTo(PipelineState::Failed);
}

void PipelineRunner::failUnexpected(PipelineStateMachine &machine, PipelineOutcome &outcome,
				    const char *what) const noexcept
{
	logger_->error("UnexpectedRunError", {{"state", toString(machine.state())}, {"what", what}});
	if (isTerminal(machine.state())) {
		return;
	}

	outcome.failureKind = FailureKind::Io;
	try {
		if (machine.state() == PipelineState::Idle) {
			machine.transitionTo(PipelineState::Acquiring);
		}
		if (isTransitionAllowed(machine.state(), PipelineState::Failed)) {
			machine.transitionTo(PipelineState::Failed);
		}
	} catch (const std::logic_error &e) {
		logger_->error("FailedStateUnreachable", {{"what", e.what()}});
	}
}

void PipelineRunner::writeEmptyManifest(const Book &book, PipelineOutcome &outcome) const
{
	outcome.manifestPath = manifestPathFor(options_.outputDirectory, book.slug);
	try {
		std::filesystem::create_directories(options_.outputDirectory);
		writeManifest(ManifestBuilder::build(book.title, {}), outcome.manifestPath);
		logger_->info("ManifestWritten", {{"path", outcome.manifestPath.string()}, {"segments", "0"}});
	} catch (const std::exception &e) {
		logger_->error("ManifestWriteFailed", {{"path", outcome.manifestPath.string()}, {"what", e.what()}});
	}
}

void PipelineRunner::finish(RunContext &context, PipelineStateMachine &machine, PipelineOutcome &outcome) const
{
	context.markEnd();
	outcome.state = machine.state();

	if (context.hasFailures()) {
		const std::filesystem::path reportPath = options_.outputDirectory / kFailureReportFileName;
		try {
			std::filesystem::create_directories(options_.outputDirectory);
			context.writeFailureReport(reportPath);
			outcome.reportPath = reportPath;
			logger_->info("FailureReportWritten", {{"path", reportPath.string()},
							      {"failures", std::to_string(context.failures().size())}});
		} catch (const std::exception &e) {
			logger_->error("FailureReportWriteFailed", {{"path", reportPath.string()}, {"what", e.what()}});
		}
	}

	const RunStats stats = context.stats();
	const double elapsedSeconds = std::chrono::duration<double>(context.elapsed()).count();
	logger_->info("RunSummary",
		      {{"state", toString(outcome.state)},
		       {"failureKind", toString(outcome.failureKind)},
		       {"found", std::to_string(stats.totalChunks)},
		       {"succeeded", std::to_string(stats.successfulDownloads)},
		       {"failed", std::to_string(stats.failedDownloads)},
		       {"decodeFailures", std::to_string(stats.decodeFailures)},
		       {"totalMb", fmt::format("{:.2f}", static_cast<double>(stats.totalBytes) / (1024.0 * 1024.0))},
		       {"elapsedSeconds", fmt::format("{:.1f}", elapsedSeconds)},
		       {"segments", std::to_string(outcome.segments.size())}});
}

} // namespace Bookbinder::Pipeline
