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
#include <optional>
#include <string>

namespace Bookbinder::Pipeline {

/// Remote folder storage. Every operation throws StorageError on failure.
class IStorageClient {
public:
	IStorageClient() noexcept = default;
	virtual ~IStorageClient() = default;

	IStorageClient(const IStorageClient &) = delete;
	IStorageClient &operator=(const IStorageClient &) = delete;
	IStorageClient(IStorageClient &&) = delete;
	IStorageClient &operator=(IStorageClient &&) = delete;

	virtual std::string createFolder(const std::string &name, const std::optional<std::string> &parentId) = 0;

	virtual std::optional<std::string> findFolder(const std::string &name,
						      const std::optional<std::string> &parentId) = 0;

	virtual std::string upload(const std::filesystem::path &localPath, const std::string &parentId,
				   const std::string &name) = 0;
};

} // namespace Bookbinder::Pipeline
