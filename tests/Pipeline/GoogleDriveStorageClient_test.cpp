/*
 * SPDX-FileCopyrightText: Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 * SPDX-License-Identifier: MIT
 *
 * Bookbinder Pipeline Tests
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

#include <memory>

#include <Bookbinder/CurlHelper/CurlHandle.hpp>
#include <Bookbinder/GoogleAuth/GoogleAuthManager.hpp>
#include <Bookbinder/GoogleAuth/GoogleTokenStorage.hpp>
#include <Bookbinder/GoogleDriveApi/GoogleDriveApiClient.hpp>
#include <Bookbinder/Logger/NullLogger.hpp>
#include <Bookbinder/Pipeline/GoogleDriveStorageClient.hpp>
#include <Bookbinder/Pipeline/PipelineErrors.hpp>

#include <TestSupport/TemporaryDirectory.hpp>

using namespace Bookbinder;
using namespace Bookbinder::Pipeline;

TEST(MimeTypeForPathTest, MapsBookArtifacts)
{
	EXPECT_EQ(mimeTypeForPath("dune_segment_01.mp3"), "audio/mpeg");
	EXPECT_EQ(mimeTypeForPath("dune_segment_01.M4B"), "audio/mp4");
	EXPECT_EQ(mimeTypeForPath("dune_toc.json"), "application/json");
	EXPECT_EQ(mimeTypeForPath("failed_downloads.txt"), "text/plain");
	EXPECT_EQ(mimeTypeForPath("cover"), "application/octet-stream");
}

TEST(GoogleDriveStorageClientTest, MissingRefreshTokenIsStorageError)
{
	TestSupport::TemporaryDirectory tempDir;
	const auto logger = Logger::NullLogger::instance();

	GoogleAuth::GoogleOAuth2ClientCredentials credentials;
	credentials.client_id = "id";
	credentials.client_secret = "secret";

	// The token endpoint is never reached: the client refuses before any request.
	auto authManager = std::make_shared<const GoogleAuth::GoogleAuthManager>(
		std::make_shared<CurlHelper::CurlHandle>(), credentials, logger, "http://127.0.0.1:9/token");
	auto tokenStorage =
		std::make_shared<const GoogleAuth::GoogleTokenStorage>(tempDir.path / "token.json", logger);
	auto apiClient = std::make_shared<GoogleDriveApi::GoogleDriveApiClient>(
		std::make_shared<CurlHelper::CurlHandle>(), logger);

	GoogleDriveStorageClient client(apiClient, authManager, tokenStorage, logger);

	EXPECT_THROW(client.findFolder("audiobooks", std::nullopt), StorageError);
	EXPECT_THROW(client.createFolder("audiobooks", std::nullopt), StorageError);
}
