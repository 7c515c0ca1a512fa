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

#include "LocalChunks.hpp"

#include <algorithm>
#include <cctype>
#include <regex>
#include <stdexcept>
#include <string_view>

namespace Bookbinder::Pipeline {

std::vector<Chunk> scanChunkDirectory(const std::filesystem::path &directory, const std::string &extension,
				      const std::shared_ptr<const Logger::ILogger> &logger)
{
	if (!std::filesystem::is_directory(directory)) {
		throw std::runtime_error("DirectoryNotExistError(scanChunkDirectory):" + directory.string());
	}

	if (extension.empty() ||
	    !std::all_of(extension.begin(), extension.end(), [](unsigned char c) { return std::isalnum(c); })) {
		throw std::invalid_argument("ExtensionInvalidError(scanChunkDirectory):" + extension);
	}

	const std::regex pattern("audio_(\\d{1,9})\\." + extension, std::regex::icase);

	std::vector<Chunk> chunks;
	for (const auto &entry : std::filesystem::directory_iterator(directory)) {
		if (!entry.is_regular_file())
			continue;

		const std::string name = entry.path().filename().string();
		std::smatch match;
		if (!std::regex_match(name, match, pattern))
			continue;

		const int remoteIndex = std::stoi(match[1].str());
		if (remoteIndex <= 0)
			continue;

		chunks.emplace_back(remoteIndex, std::string(), entry.path(), entry.file_size());
	}

	std::sort(chunks.begin(), chunks.end(), [](const Chunk &a, const Chunk &b) {
		if (a.remoteIndex() != b.remoteIndex()) {
			return a.remoteIndex() < b.remoteIndex();
		}
		return a.localPath().filename() < b.localPath().filename();
	});

	const auto duplicates = std::unique(chunks.begin(), chunks.end(), [&logger](const Chunk &kept, const Chunk &next) {
		if (kept.remoteIndex() != next.remoteIndex()) {
			return false;
		}
		logger->warn("DuplicateChunkIndex", {{"index", std::to_string(next.remoteIndex())},
						     {"kept", kept.localPath().filename().string()},
						     {"skipped", next.localPath().filename().string()}});
		return true;
	});
	chunks.erase(duplicates, chunks.end());

	for (std::size_t i = 0; i < chunks.size(); ++i) {
		chunks[i].assignSequenceIndex(static_cast<int>(i + 1));
	}

	return chunks;
}

std::string titleForChunkDirectory(const std::filesystem::path &directory)
{
	std::filesystem::path normalized = directory.lexically_normal();
	if (!normalized.has_filename()) {
		normalized = normalized.parent_path();
	}

	std::string name = normalized.filename().string();
	constexpr std::string_view kTemporaryPrefix = "temp_";
	if (name.starts_with(kTemporaryPrefix)) {
		name.erase(0, kTemporaryPrefix.size());
	}

	std::string title;
	bool wordStart = true;
	for (const char ch : name) {
		if (ch == '_' || std::isspace(static_cast<unsigned char>(ch))) {
			if (!title.empty() && title.back() != ' ') {
				title.push_back(' ');
			}
			wordStart = true;
			continue;
		}
		title.push_back(wordStart ? static_cast<char>(std::toupper(static_cast<unsigned char>(ch))) : ch);
		wordStart = false;
	}
	while (!title.empty() && title.back() == ' ') {
		title.pop_back();
	}
	return title;
}

} // namespace Bookbinder::Pipeline
