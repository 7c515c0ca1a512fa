/*
 * SPDX-FileCopyrightText: Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 * SPDX-License-Identifier: MIT
 *
 * Bookbinder AudioCodec Library
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
#include <vector>

#include "AudioInfo.hpp"

namespace Bookbinder::AudioCodec {

class IAudioCodec {
public:
	IAudioCodec() noexcept = default;
	virtual ~IAudioCodec() = default;

	IAudioCodec(const IAudioCodec &) = delete;
	IAudioCodec &operator=(const IAudioCodec &) = delete;
	IAudioCodec(IAudioCodec &&) = delete;
	IAudioCodec &operator=(IAudioCodec &&) = delete;

	virtual bool isAvailable() const = 0;

	/// Throws DecodeError.
	virtual AudioInfo probe(const std::filesystem::path &path) const = 0;

	/// Concatenates `inputs` in order and encodes them into `output`. Throws ExportError.
	virtual void encode(const std::vector<std::filesystem::path> &inputs, const std::filesystem::path &output,
			    int bitrateKbps) const = 0;
};

} // namespace Bookbinder::AudioCodec
