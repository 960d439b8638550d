/*
 * SPDX-FileCopyrightText: Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 * SPDX-License-Identifier: MIT
 *
 * DriveLink CallbackServer Library
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

#include <DriveLink/CallbackServer/CallbackRequest.hpp>

using namespace DriveLink::CallbackServer;

TEST(CallbackRequestTest, ParseRequestTarget_Get)
{
	const auto url = parseRequestTarget("GET /callback?code=abc&state=xyz HTTP/1.1\r\nHost: localhost\r\n\r\n");
	ASSERT_TRUE(url.has_value());
	EXPECT_EQ(url->path(), "/callback");
}

TEST(CallbackRequestTest, ParseRequestTarget_RejectsOtherRequests)
{
	EXPECT_FALSE(parseRequestTarget("POST /callback HTTP/1.1\r\n\r\n").has_value());
	EXPECT_FALSE(parseRequestTarget("GET callback HTTP/1.1\r\n\r\n").has_value());
	EXPECT_FALSE(parseRequestTarget("garbage").has_value());
	EXPECT_FALSE(parseRequestTarget("").has_value());
}

TEST(CallbackRequestTest, ParseCallbackParams_DecodesValues)
{
	const auto url = parseRequestTarget("GET /callback?code=4%2F0Ab%2Bc%3D&state=s%20t HTTP/1.1\r\n\r\n");
	ASSERT_TRUE(url.has_value());

	const auto params = parseCallbackParams(*url);
	EXPECT_EQ(params.code, "4/0Ab+c=");
	EXPECT_EQ(params.state, "s t");
	EXPECT_FALSE(params.error.has_value());
}

TEST(CallbackRequestTest, ParseCallbackParams_Error)
{
	const auto url = parseRequestTarget(
		"GET /callback?error=access_denied&error_description=User%20denied&state=s HTTP/1.1\r\n\r\n");
	ASSERT_TRUE(url.has_value());

	const auto params = parseCallbackParams(*url);
	EXPECT_FALSE(params.code.has_value());
	EXPECT_EQ(params.error, "access_denied");
	EXPECT_EQ(params.errorDescription, "User denied");
	EXPECT_EQ(params.state, "s");
}

TEST(CallbackRequestTest, ParseCallbackParams_Absent)
{
	const auto url = parseRequestTarget("GET /callback HTTP/1.1\r\n\r\n");
	ASSERT_TRUE(url.has_value());

	const auto params = parseCallbackParams(*url);
	EXPECT_FALSE(params.code.has_value());
	EXPECT_FALSE(params.state.has_value());
	EXPECT_FALSE(params.error.has_value());
}
