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

#include "BookNaming.hpp"

#include <cctype>
#include <regex>
#include <stdexcept>

#include <Bookbinder/CurlHelper/CurlUrlHandle.hpp>

namespace Bookbinder::Discovery {

namespace {

bool isWordChar(unsigned char c)
{
	// Bytes of multi-byte UTF-8 sequences are kept so that non-ASCII titles survive.
	return std::isalnum(c) || c == '_' || c >= 0x80;
}

std::size_t utf8SequenceLength(std::string_view text, std::size_t pos)
{
	const auto lead = static_cast<unsigned char>(text[pos]);
	std::size_t length = 0;
	unsigned char low = 0x80;
	unsigned char high = 0xBF;
	if (lead < 0x80) {
		return 1;
	} else if (lead >= 0xC2 && lead <= 0xDF) {
		length = 2;
	} else if (lead >= 0xE0 && lead <= 0xEF) {
		length = 3;
		if (lead == 0xE0) {
			low = 0xA0;
		} else if (lead == 0xED) {
			high = 0x9F;
		}
	} else if (lead >= 0xF0 && lead <= 0xF4) {
		length = 4;
		if (lead == 0xF0) {
			low = 0x90;
		} else if (lead == 0xF4) {
			high = 0x8F;
		}
	} else {
		return 0;
	}

	if (pos + length > text.size()) {
		return 0;
	}
	for (std::size_t i = 1; i < length; ++i) {
		const auto c = static_cast<unsigned char>(text[pos + i]);
		// Only the first continuation byte has a narrowed range.
		const unsigned char min = i == 1 ? low : 0x80;
		const unsigned char max = i == 1 ? high : 0xBF;
		if (c < min || c > max) {
			return 0;
		}
	}
	return length;
}

} // anonymous namespace

std::string toValidUtf8(std::string_view text)
{
	static constexpr std::string_view kReplacement = "\xEF\xBF\xBD";

	std::string result;
	result.reserve(text.size());
	std::size_t pos = 0;
	while (pos < text.size()) {
		const std::size_t length = utf8SequenceLength(text, pos);
		if (length == 0) {
			result += kReplacement;
			++pos;
		} else {
			result.append(text.substr(pos, length));
			pos += length;
		}
	}
	return result;
}

std::string deriveBookTitle(const std::string &chunkUrl)
{
	std::string path;
	try {
		CurlHelper::CurlUrlHandle url;
		url.setUrl(chunkUrl);
		path = url.getPath(true);
	} catch (const std::runtime_error &) {
		return kUnknownBookTitle;
	}

	static const std::regex pattern(R"(/([^/]+)/\d+\.[A-Za-z0-9]+$)");
	std::smatch match;
	if (std::regex_search(path, match, pattern)) {
		return toValidUtf8(match[1].str());
	}
	return kUnknownBookTitle;
}

std::string makeBookSlug(std::string_view title)
{
	std::string slug;
	slug.reserve(title.size());
	for (char c : title) {
		if (c == ' ') {
			slug += '_';
		} else {
			slug += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
		}
	}
	return slug;
}

std::string makeSafeFolderName(std::string_view title)
{
	std::string kept;
	for (char c : title) {
		auto uc = static_cast<unsigned char>(c);
		if (isWordChar(uc) || std::isspace(uc) || c == '-') {
			kept += c;
		}
	}

	auto first = kept.find_first_not_of(" \t\r\n\f\v");
	if (first == std::string::npos) {
		return {};
	}
	auto last = kept.find_last_not_of(" \t\r\n\f\v");
	kept = kept.substr(first, last - first + 1);

	std::string result;
	bool inRun = false;
	for (char c : kept) {
		if (c == '-' || std::isspace(static_cast<unsigned char>(c))) {
			if (!inRun) {
				result += '_';
				inRun = true;
			}
		} else {
			result += c;
			inRun = false;
		}
	}
	return result;
}

} // namespace Bookbinder::Discovery
