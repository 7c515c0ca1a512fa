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

#include <stdexcept>

#include <Bookbinder/CurlHelper/CurlUrlHandle.hpp>

using namespace Bookbinder::CurlHelper;

TEST(CurlUrlHandleTest, ResolvesRelativeReferences)
{
	CurlUrlHandle url;
	url.setUrl("https://books.example.com/listen/book/index.html");

	url.resolve("../media/01.mp3");

	EXPECT_EQ(url.getUrl(), "https://books.example.com/listen/media/01.mp3");
	EXPECT_EQ(url.getHost(), "books.example.com");
}

TEST(CurlUrlHandleTest, AbsoluteReferenceReplacesUrl)
{
	CurlUrlHandle url;
	url.setUrl("https://books.example.com/listen/");

	url.resolve("https://cdn.example.net/a/02.mp3");

	EXPECT_EQ(url.getUrl(), "https://cdn.example.net/a/02.mp3");
}

TEST(CurlUrlHandleTest, DecodesPath)
{
	CurlUrlHandle url;
	url.setUrl("https://cdn.example.net/The%20Hero/03.mp3");

	EXPECT_EQ(url.getPath(), "/The%20Hero/03.mp3");
	EXPECT_EQ(url.getPath(true), "/The Hero/03.mp3");
}

TEST(CurlUrlHandleTest, AppendsQuery)
{
	CurlUrlHandle url;
	url.setUrl("https://www.googleapis.com/drive/v3/files");

	url.appendQuery("pageSize=100");
	url.appendQuery("fields=files(id,name)");

	EXPECT_EQ(url.getUrl().rfind("https://www.googleapis.com/drive/v3/files?pageSize=100&fields=", 0), 0u);
}

TEST(CurlUrlHandleTest, RejectsMalformedUrl)
{
	CurlUrlHandle url;

	EXPECT_THROW(url.setUrl("not a url"), std::runtime_error);
}
