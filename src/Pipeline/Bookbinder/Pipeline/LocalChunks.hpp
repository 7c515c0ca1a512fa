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
#include <string>
#include <vector>

#include <Bookbinder/Logger/ILogger.hpp>

#include "Chunk.hpp"

namespace Bookbinder::Pipeline {

/**
 * Collects previously downloaded `audio_<digits>.<extension>` files from
 * `directory`, ordered by number. The number becomes the remote index, so ids
 * keep the original numbering even when some files are missing. Chunks carry
 * no URL. When two files share a number (`audio_1.mp3` and `audio_01.mp3`),
 * the first by file name is kept and the other is skipped with a warning.
 */
std::vector<Chunk> scanChunkDirectory(const std::filesystem::path &directory, const std::string &extension,
				      const std::shared_ptr<const Logger::ILogger> &logger);

/// Title implied by a chunk directory name, e.g. `temp_well_of_ascension` gives "Well Of Ascension".
std::string titleForChunkDirectory(const std::filesystem::path &directory);

} // namespace Bookbinder::Pipeline
