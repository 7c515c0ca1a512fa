/*
 * SPDX-FileCopyrightText: Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 * SPDX-License-Identifier: MIT
 *
 * Bookbinder GoogleAuth Tests
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

#include <filesystem>
#include <stdexcept>

#include <Bookbinder/GoogleAuth/GoogleTokenStorage.hpp>
#include <Bookbinder/Logger/NullLogger.hpp>

#include <TestSupport/TemporaryDirectory.hpp>

using namespace Bookbinder;
using namespace Bookbinder::GoogleAuth;

class GoogleTokenStorageTest : public ::testing::Test {
protected:
	TestSupport::TemporaryDirectory tempDir;
};

TEST_F(GoogleTokenStorageTest, MissingFileLoadsNothing)
{
	const GoogleTokenStorage storage(tempDir.path / "token.json", Logger::NullLogger::instance());

	EXPECT_FALSE(storage.load().has_value());
}

TEST_F(GoogleTokenStorageTest, SaveThenLoad)
{
	const GoogleTokenStorage storage(tempDir.path / "nested" / "token.json", Logger::NullLogger::instance());
	GoogleTokenState state;
	state.access_token = "ya29.a";
	state.refresh_token = "1//r";
	state.scope = "drive.file";
	state.expires_at = 1'700'000'123;

	storage.save(state);
	const auto loaded = storage.load();

	ASSERT_TRUE(loaded.has_value());
	EXPECT_EQ(loaded->access_token, "ya29.a");
	EXPECT_EQ(loaded->refresh_token, "1//r");
	EXPECT_EQ(loaded->scope, "drive.file");
	EXPECT_EQ(loaded->expires_at, 1'700'000'123);
	EXPECT_FALSE(std::filesystem::exists(tempDir.path / "nested" / "token.json.tmp"));
}

TEST_F(GoogleTokenStorageTest, SaveKeepsBackupOfPreviousFile)
{
	const auto path = tempDir.path / "token.json";
	const GoogleTokenStorage storage(path, Logger::NullLogger::instance());
	GoogleTokenState first;
	first.refresh_token = "1//first";
	GoogleTokenState second;
	second.refresh_token = "1//second";

	storage.save(first);
	storage.save(second);

	EXPECT_EQ(storage.load()->refresh_token, "1//second");
	EXPECT_NE(TestSupport::readFile(tempDir.path / "token.json.bak").find("1//first"), std::string::npos);
}

TEST_F(GoogleTokenStorageTest, MalformedFileThrows)
{
	const auto path = tempDir.write("token.json", "{ not json");
	const GoogleTokenStorage storage(path, Logger::NullLogger::instance());

	EXPECT_THROW(storage.load(), std::runtime_error);
}
