/*
 * SPDX-FileCopyrightText: Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 * SPDX-License-Identifier: MIT
 *
 * Bookbinder Discovery Tests
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

#include <Bookbinder/Discovery/BookNaming.hpp>
#include <Bookbinder/Discovery/PageDiscovery.hpp>

#include <TestSupport/TemporaryDirectory.hpp>

using namespace Bookbinder;
using namespace Bookbinder::Discovery;

TEST(ExtractAudioSourcesTest, CollectsAudioAndNestedSourceElements)
{
	const char *html = R"(
		<html><body>
		<img src="cover.jpg">
		<audio controls src="chapter01.mp3"></audio>
		<AUDIO preload="none">
			<source src='chapter02.mp3' type="audio/mpeg">
			<source data-src="ignored.mp3">
		</AUDIO>
		<source src="orphan.mp3">
		<audio src="chapter03.mp3?a=1&amp;b=2"/>
		</body></html>
	)";

	const auto sources = extractAudioSources(html);

	EXPECT_EQ(sources, (std::vector<std::string>{"chapter01.mp3", "chapter02.mp3", "chapter03.mp3?a=1&b=2"}));
}

TEST(ExtractAudioSourcesTest, SelfClosingAudioDoesNotAdoptFollowingSources)
{
	const char *html = R"(<audio src="a.mp3" /><source src="b.mp3">)";

	EXPECT_EQ(extractAudioSources(html), (std::vector<std::string>{"a.mp3"}));
}

TEST(ExtractAudioSourcesTest, PageWithoutAudioYieldsNothing)
{
	EXPECT_TRUE(extractAudioSources("<p>No audio here</p>").empty());
}

TEST(NormalizeUrlsTest, ResolvesRelativeReferencesAndRemovesDuplicates)
{
	const std::vector<std::string> sources = {"01.mp3", "/books/Dune/02.mp3", "01.mp3",
						  "https://other.example.net/03.mp3"};

	const auto urls = normalizeUrls(sources, "https://cdn.example.com/books/Dune/index.html", "");

	EXPECT_EQ(urls, (std::vector<std::string>{"https://cdn.example.com/books/Dune/01.mp3",
						  "https://cdn.example.com/books/Dune/02.mp3",
						  "https://other.example.net/03.mp3"}));
}

TEST(NormalizeUrlsTest, HostFilterKeepsMatchingHostsOnly)
{
	const std::vector<std::string> sources = {"https://cdn.example.com/b/01.mp3", "https://ads.example.net/x.mp3"};

	const auto urls = normalizeUrls(sources, "", "cdn.example");

	EXPECT_EQ(urls, (std::vector<std::string>{"https://cdn.example.com/b/01.mp3"}));
}

TEST(ReadUrlListTest, SkipsBlankAndCommentLines)
{
	TestSupport::TemporaryDirectory tempDir;
	const auto path = tempDir.write("urls.txt", "# chapters\n"
						    "https://cdn.example.com/b/My%20Book/01.mp3\n"
						    "\n"
						    "   https://cdn.example.com/b/My%20Book/02.mp3  \r\n");

	const auto urls = readUrlList(path);

	ASSERT_EQ(urls.size(), 2u);
	EXPECT_EQ(urls[1], "https://cdn.example.com/b/My%20Book/02.mp3");
	EXPECT_THROW(readUrlList(tempDir.path / "missing.txt"), std::runtime_error);
}

TEST(MakeDiscoveryResultTest, TitleComesFromFirstUrl)
{
	const auto result = makeDiscoveryResult({"https://cdn.example.com/b/My%20Book/01.mp3",
						 "https://cdn.example.com/b/My%20Book/02.mp3"});

	EXPECT_EQ(result.title, "My Book");
	EXPECT_EQ(result.urls.size(), 2u);
	EXPECT_EQ(makeDiscoveryResult({}).title, kUnknownBookTitle);
}
