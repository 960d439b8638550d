/*
 * SPDX-FileCopyrightText: Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 * SPDX-License-Identifier: MIT
 *
 * DriveLink OAuth2 Library
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

#include <DriveLink/OAuth2/AuthError.hpp>
#include <DriveLink/OAuth2/TokenResponse.hpp>

using namespace DriveLink::OAuth2;

TEST(TokenResponseTest, Parse_FullBody)
{
	const TokenResponse response = parseTokenResponse(
		R"({"access_token":"AT","refresh_token":"RT","expires_in":3599,"token_type":"Bearer","scope":"s"})");

	EXPECT_EQ(response.access_token, "AT");
	EXPECT_EQ(response.refresh_token, "RT");
	EXPECT_EQ(response.expires_in, 3599);
	EXPECT_EQ(response.token_type, "Bearer");
	EXPECT_EQ(response.scope, "s");
}

TEST(TokenResponseTest, Parse_MinimalBody)
{
	const TokenResponse response = parseTokenResponse(R"({"access_token":"AT2"})");

	EXPECT_EQ(response.access_token, "AT2");
	EXPECT_FALSE(response.refresh_token.has_value());
	EXPECT_FALSE(response.expires_in.has_value());
	EXPECT_FALSE(response.token_type.has_value());
}

TEST(TokenResponseTest, Parse_NullOptionalFields)
{
	const TokenResponse response = parseTokenResponse(R"({"access_token":"AT","refresh_token":null})");
	EXPECT_FALSE(response.refresh_token.has_value());
}

TEST(TokenResponseTest, Parse_RejectsInvalidBodies)
{
	for (const char *body : {"", "not json", "[]", R"({"expires_in":10})", R"({"access_token":""})",
				 R"({"access_token":42})", R"({"access_token":"AT","expires_in":"soon"})"}) {
		try {
			(void)parseTokenResponse(body);
			ADD_FAILURE() << "accepted: " << body;
		} catch (const AuthError &e) {
			EXPECT_EQ(e.kind(), AuthErrorKind::InvalidResponse) << body;
		}
	}
}

TEST(TokenResponseTest, Parse_AcceptsExpiresInBounds)
{
	EXPECT_EQ(parseTokenResponse(R"({"access_token":"AT","expires_in":0})").expires_in, 0);
	EXPECT_EQ(parseTokenResponse(R"({"access_token":"AT","expires_in":315360000})").expires_in,
		  kMaxExpiresInSeconds);
}

TEST(TokenResponseTest, Parse_RejectsExpiresInOutOfRange)
{
	for (const char *body : {
		     R"({"access_token":"AT","expires_in":315360001})",
		     R"({"access_token":"AT","expires_in":9223372036854775807})",
		     R"({"access_token":"AT","expires_in":18446744073709551615})",
		     R"({"access_token":"AT","expires_in":-1})",
		     R"({"access_token":"AT","expires_in":-9223372036854775808})",
		     R"({"access_token":"AT","expires_in":1e300})",
		     R"({"access_token":"AT","expires_in":3599.5})",
		     R"({"access_token":"AT","expires_in":true})",
	     }) {
		try {
			(void)parseTokenResponse(body);
			ADD_FAILURE() << "accepted: " << body;
		} catch (const AuthError &e) {
			EXPECT_EQ(e.kind(), AuthErrorKind::InvalidResponse) << body;
		}
	}
}

TEST(AuthErrorTest, WhatNamesKindAndDetail)
{
	const AuthError withDetail(AuthErrorKind::TokenExchangeFailed, "body");
	EXPECT_STREQ(withDetail.what(), "TokenExchangeFailed: body");
	EXPECT_EQ(withDetail.detail(), "body");

	const AuthError bare(AuthErrorKind::NotAuthenticated);
	EXPECT_STREQ(bare.what(), "NotAuthenticated");
}
