/*
 * SPDX-FileCopyrightText: Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 * SPDX-License-Identifier: MIT
 *
 * Bookbinder Discovery Library
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

#include <string>
#include <string_view>

namespace Bookbinder::Discovery {

inline constexpr const char *kUnknownBookTitle = "Unknown Book";

/**
 * Derives the book title from a chunk URL such as
 * `https://host/books/My%20Book/01.mp3`: the URL-decoded path segment right
 * before a numeric file name. Falls back to kUnknownBookTitle.
 */
std::string deriveBookTitle(const std::string &chunkUrl);

/// Replaces every byte that does not start a well-formed UTF-8 sequence with U+FFFD.
std::string toValidUtf8(std::string_view text);

/// Lowercases the title and replaces spaces with underscores.
std::string makeBookSlug(std::string_view title);

/// Keeps word characters, whitespace and '-', then collapses runs of '-' and whitespace into '_'.
std::string makeSafeFolderName(std::string_view title);

} // namespace Bookbinder::Discovery
