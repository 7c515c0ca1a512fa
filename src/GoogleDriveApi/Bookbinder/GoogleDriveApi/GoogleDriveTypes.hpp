/*
 * SPDX-FileCopyrightText: Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 * SPDX-License-Identifier: MIT
 *
 * Bookbinder GoogleDriveApi Library
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

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json_fwd.hpp>

namespace Bookbinder::GoogleDriveApi {

inline constexpr const char *kFolderMimeType = "application/vnd.google-apps.folder";

/// Subset of the Drive v3 File resource requested through the `fields` parameter.
struct GoogleDriveFile {
	std::string kind;
	std::string id;
	std::string name;
	std::string mimeType;
	std::vector<std::string> parents;
	std::optional<std::uint64_t> size;

	[[nodiscard]]
	bool isFolder() const
	{
		return mimeType == kFolderMimeType;
	}
};

void to_json(nlohmann::json &j, const GoogleDriveFile &p);
void from_json(const nlohmann::json &j, GoogleDriveFile &p);

/// Request body for files.create, used for both folders and upload sessions.
struct GoogleDriveFileMetadata {
	std::string name;
	std::optional<std::string> mimeType;
	std::vector<std::string> parents;
};

void to_json(nlohmann::json &j, const GoogleDriveFileMetadata &p);

} // namespace Bookbinder::GoogleDriveApi
