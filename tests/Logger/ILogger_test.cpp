/*
 * SPDX-FileCopyrightText: Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 * SPDX-License-Identifier: MIT
 *
 * DriveLink Logger Library
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

#include <DriveLink/Logger/ILogger.hpp>

#include "Logger/RecordingLogger.hpp"

using namespace DriveLink::Logger;
using DriveLink::Logger::Testing::RecordingLogger;

TEST(IsSecretKeyTest, CredentialKeysAreSecret)
{
	EXPECT_TRUE(isSecretKey("code"));
	EXPECT_TRUE(isSecretKey("authorization"));
	EXPECT_TRUE(isSecretKey("access_token"));
	EXPECT_TRUE(isSecretKey("refresh_token"));
	EXPECT_TRUE(isSecretKey("client_secret"));
	EXPECT_TRUE(isSecretKey("code_verifier"));
	EXPECT_TRUE(isSecretKey("expected_state"));
}

TEST(IsSecretKeyTest, OrdinaryKeysAreNot)
{
	EXPECT_FALSE(isSecretKey("status"));
	EXPECT_FALSE(isSecretKey("attempt"));
	EXPECT_FALSE(isSecretKey("expires_at"));
	EXPECT_FALSE(isSecretKey("has_code"));
	EXPECT_FALSE(isSecretKey("error"));
}

TEST(ILoggerTest, SecretValuesNeverReachTheSink)
{
	RecordingLogger logger;
	const std::string token = "ya29.secret-access-token";

	logger.info("TokenIssued", {{"access_token", token}, {"status", "200"}, {"code", "4/0Abc"}});

	const auto events = logger.events();
	ASSERT_EQ(events.size(), 1u);
	EXPECT_EQ(events[0].name, "TokenIssued");
	EXPECT_EQ(events[0].field("access_token"), kRedactedValue);
	EXPECT_EQ(events[0].field("code"), kRedactedValue);
	EXPECT_EQ(events[0].field("status"), "200");
	EXPECT_FALSE(logger.loggedValue(token));
}

TEST(ILoggerTest, FieldsBeyondLimitAreDropped)
{
	RecordingLogger logger;

	logger.debug("Crowded", {{"f0", "0"},  {"f1", "1"},  {"f2", "2"},  {"f3", "3"},  {"f4", "4"},  {"f5", "5"},
				 {"f6", "6"},  {"f7", "7"},  {"f8", "8"},  {"f9", "9"},  {"f10", "10"}, {"f11", "11"},
				 {"f12", "12"}, {"f13", "13"}, {"f14", "14"}, {"f15", "15"}, {"f16", "16"}});

	const auto events = logger.events();
	ASSERT_EQ(events.size(), 1u);
	EXPECT_EQ(events[0].fields.size(), ILogger::kMaxFields);
	EXPECT_EQ(events[0].field("f15"), "15");
	EXPECT_EQ(events[0].field("f16"), "");
}
