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

#include <DriveLink/OAuth2/AuthorizationRequestBuilder.hpp>

#include "OAuth2TestSupport.hpp"

using namespace DriveLink::OAuth2;

class AuthorizationRequestBuilderTest : public ::testing::Test {
protected:
	static void SetUpTestSuite() { curl_global_init(CURL_GLOBAL_DEFAULT); }
	static void TearDownTestSuite() { curl_global_cleanup(); }
};

TEST_F(AuthorizationRequestBuilderTest, Build_ParameterOrder)
{
	const AuthorizationRequestBuilder builder{OAuth2Config()};

	const std::string url = builder.build({"id", "secret"}, "STATE", "CHALLENGE");
	const FormFields query = Testing::parseQuery(url);

	const std::vector<std::string> expectedNames{"client_id",	  "redirect_uri", "response_type",
						     "scope",		  "state",	  "code_challenge",
						     "code_challenge_method", "access_type", "prompt"};
	ASSERT_EQ(query.size(), expectedNames.size());
	for (std::size_t i = 0; i < expectedNames.size(); i++) {
		EXPECT_EQ(query[i].first, expectedNames[i]);
	}
	EXPECT_EQ(Testing::formValue(query, "state"), "STATE");
	EXPECT_EQ(Testing::formValue(query, "code_challenge"), "CHALLENGE");
}

TEST_F(AuthorizationRequestBuilderTest, Build_PercentEncodesValues)
{
	OAuth2Config config;
	config.scope = "openid email https://www.googleapis.com/auth/drive.readonly";

	const std::string url = AuthorizationRequestBuilder(config).build({"id with space&more", "secret"}, "s", "c");

	EXPECT_NE(url.find("client_id=id%20with%20space%26more"), std::string::npos) << url;
	EXPECT_EQ(Testing::formValue(Testing::parseQuery(url), "scope"), config.scope);
	EXPECT_EQ(url.find(' '), std::string::npos);
}

TEST_F(AuthorizationRequestBuilderTest, Build_UsesConfiguredEndpointAndExtras)
{
	OAuth2Config config;
	config.authorizationEndpoint = "https://auth.example.test/authorize";
	config.redirectUri = "http://127.0.0.1:9000/cb";
	config.extraAuthorizationParams = {{"login_hint", "me@example.com"}};

	const std::string url = AuthorizationRequestBuilder(config).build({"id", "secret"}, "s", "c");
	const FormFields query = Testing::parseQuery(url);

	EXPECT_EQ(url.rfind("https://auth.example.test/authorize?", 0), 0u) << url;
	EXPECT_EQ(Testing::formValue(query, "redirect_uri"), "http://127.0.0.1:9000/cb");
	EXPECT_EQ(Testing::formValue(query, "login_hint"), "me@example.com");
	EXPECT_EQ(Testing::formValue(query, "access_type"), "");
}
