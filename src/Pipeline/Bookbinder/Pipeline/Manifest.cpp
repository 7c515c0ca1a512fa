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

#include "Manifest.hpp"

#include <fstream>
#include <stdexcept>
#include <utility>

#include <nlohmann/json.hpp>

#include "IsoTime.hpp"

namespace Bookbinder::Pipeline {

namespace {

nlohmann::json segmentToJson(const SegmentSummary &segment)
{
	return nlohmann::json{
		{"segment", segment.index},
		{"file", segment.fileName},
		{"duration_minutes", segment.durationMinutes},
		{"size_mb", segment.sizeMb},
		{"original_files", segment.originalFiles},
	};
}

} // anonymous namespace

void to_json(nlohmann::json &j, const Manifest &p)
{
	nlohmann::json segments = nlohmann::json::array();
	for (const auto &segment : p.segments) {
		segments.push_back(segmentToJson(segment));
	}

	j = nlohmann::json{
		{"book_title", p.bookTitle},
		{"created_date", formatIsoUtc(p.createdDate)},
		{"total_segments", p.totalSegments()},
		{"segments", std::move(segments)},
	};
}

Manifest ManifestBuilder::build(std::string bookTitle, std::vector<SegmentSummary> segments,
				std::chrono::system_clock::time_point now)
{
	return Manifest{std::move(bookTitle), now, std::move(segments)};
}

std::filesystem::path manifestPathFor(const std::filesystem::path &outputDirectory, const std::string &bookSlug)
{
	return outputDirectory / (bookSlug + "_toc.json");
}

void writeManifest(const Manifest &manifest, const std::filesystem::path &path)
{
	const nlohmann::json j = manifest;

	std::filesystem::path tmpPath = path;
	tmpPath += ".tmp";

	std::ofstream ofs(tmpPath, std::ios::out | std::ios::trunc);
	if (!ofs.is_open()) {
		throw std::runtime_error("FileOpenError(writeManifest):" + tmpPath.string());
	}

	ofs << j.dump(2) << '\n';
	ofs.close();
	if (ofs.fail()) {
		throw std::runtime_error("FileWriteError(writeManifest):" + tmpPath.string());
	}

	std::filesystem::rename(tmpPath, path);
}

} // namespace Bookbinder::Pipeline
