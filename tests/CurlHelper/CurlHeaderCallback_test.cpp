/*
 * SPDX-FileCopyrightText: Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 * SPDX-License-Identifier: MIT
 *
 * Bookbinder CurlHelper Tests
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

#include <gtest/gtest.h>

#include <string>

#include <Bookbinder/CurlHelper/CurlHeaderCallback.hpp>

using namespace Bookbinder::CurlHelper;

namespace {

void feed(CurlHeaderMap &headers, std::string line)
{
	const std::size_t consumed = CurlHeaderMapCallback(line.data(), 1, line.size(), &headers);
	ASSERT_EQ(consumed, line.size());
}

} // anonymous namespace

TEST(CurlHeaderCallbackTest, StoresLowercasedTrimmedHeaders)
{
	CurlHeaderMap headers;

	feed(headers, "HTTP/1.1 200 OK\r\n");
	feed(headers, "Location:  https://upload.example.com/session?id=1 \r\n");
	feed(headers, "Content-Type: application/json\r\n");
	feed(headers, "\r\n");

	EXPECT_EQ(headers.at("location"), "https://upload.example.com/session?id=1");
	EXPECT_EQ(headers.at("content-type"), "application/json");
}

TEST(CurlHeaderCallbackTest, StatusLineStartsNewHeaderBlock)
{
	CurlHeaderMap headers;

	feed(headers, "HTTP/1.1 302 Found\r\n");
	feed(headers, "Location: https://elsewhere.example.com/\r\n");
	feed(headers, "\r\n");
	feed(headers, "HTTP/2 200\r\n");
	feed(headers, "X-Final: yes\r\n");

	EXPECT_EQ(headers.count("location"), 0u);
	EXPECT_EQ(headers.at("x-final"), "yes");
}
