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
#include <filesystem>
#include <string>
#include <vector>

#include <nlohmann/json_fwd.hpp>

#include "SegmentSummary.hpp"

namespace Bookbinder::Pipeline {

struct Manifest {
	std::string bookTitle;
	std::chrono::system_clock::time_point createdDate;
	std::vector<SegmentSummary> segments;

	[[nodiscard]]
	std::size_t totalSegments() const noexcept
	{
		return segments.size();
	}
};

void to_json(nlohmann::json &j, const Manifest &p);

class ManifestBuilder {
public:
	/// Aggregates the closed segments as they are. An empty list is valid.
	static Manifest build(std::string bookTitle, std::vector<SegmentSummary> segments,
			      std::chrono::system_clock::time_point now = std::chrono::system_clock::now());
};

/// `{outputDirectory}/{slug}_toc.json`
std::filesystem::path manifestPathFor(const std::filesystem::path &outputDirectory, const std::string &bookSlug);

/// Writes the manifest as JSON indented by 2. Throws std::runtime_error on I/O failure.
void writeManifest(const Manifest &manifest, const std::filesystem::path &path);

} // namespace Bookbinder::Pipeline
