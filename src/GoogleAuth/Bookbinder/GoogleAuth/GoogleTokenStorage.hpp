/*
 * SPDX-FileCopyrightText: Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 * SPDX-License-Identifier: MIT
 *
 * Bookbinder GoogleAuth Library
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

#include <Bookbinder/Logger/ILogger.hpp>

#include "GoogleTokenState.hpp"

namespace Bookbinder::GoogleAuth {

/**
 * Persists a GoogleTokenState as a JSON file. Writes go to a sibling ".tmp"
 * file which then replaces the previous one, keeping a ".bak" copy.
 */
class GoogleTokenStorage {
public:
	GoogleTokenStorage(std::filesystem::path tokenFilePath, std::shared_ptr<const Logger::ILogger> logger);
	~GoogleTokenStorage() noexcept = default;

	GoogleTokenStorage(const GoogleTokenStorage &) = delete;
	GoogleTokenStorage &operator=(const GoogleTokenStorage &) = delete;
	GoogleTokenStorage(GoogleTokenStorage &&) = delete;
	GoogleTokenStorage &operator=(GoogleTokenStorage &&) = delete;

	/// Returns std::nullopt when the file does not exist. A file that exists but
	/// cannot be parsed raises std::runtime_error.
	std::optional<GoogleTokenState> load() const;

	void save(const GoogleTokenState &tokenState) const;

	const std::filesystem::path &path() const noexcept { return tokenFilePath_; }

private:
	const std::filesystem::path tokenFilePath_;
	const std::shared_ptr<const Logger::ILogger> logger_;
};

} // namespace Bookbinder::GoogleAuth
