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

#include <set>
#include <string>
#include <vector>

#include <DriveLink/OAuth2/Pkce.hpp>

using namespace DriveLink::OAuth2;

namespace {

bool isUnreservedBase64Url(const std::string &s)
{
	for (char c : s) {
		const bool ok = (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '-' ||
				c == '_';
		if (!ok) {
			return false;
		}
	}
	return true;
}

} // anonymous namespace

TEST(PkceTest, GenerateCodeVerifier_LengthAndAlphabet)
{
	for (int i = 0; i < 64; i++) {
		const std::string verifier = Pkce::generateCodeVerifier();
		EXPECT_EQ(verifier.size(), 43u);
		EXPECT_GE(verifier.size(), 43u);
		EXPECT_LE(verifier.size(), 128u);
		EXPECT_TRUE(isUnreservedBase64Url(verifier)) << verifier;
	}
}

TEST(PkceTest, GenerateCodeVerifier_IsUnique)
{
	std::set<std::string> seen;
	for (int i = 0; i < 256; i++) {
		seen.insert(Pkce::generateCodeVerifier());
	}
	EXPECT_EQ(seen.size(), 256u);
}

TEST(PkceTest, GenerateCodeChallenge_Rfc7636AppendixB)
{
	EXPECT_EQ(Pkce::generateCodeChallenge("dBjftJeZ4CVP-1B0Ig_GYWlE1fA5eH1DX3k2KGjqfdE"),
		  "E9Melhoa2OwvFrEMTJguCHaoeK1t8URWbuGJSstw-cM");
}

TEST(PkceTest, GenerateCodeChallenge_IsDeterministic)
{
	const std::string verifier = Pkce::generateCodeVerifier();
	EXPECT_EQ(Pkce::generateCodeChallenge(verifier), Pkce::generateCodeChallenge(verifier));
}

TEST(PkceTest, GenerateCodeChallenge_HasNoPadding)
{
	const std::string challenge = Pkce::generateCodeChallenge(Pkce::generateCodeVerifier());
	EXPECT_EQ(challenge.size(), 43u);
	EXPECT_TRUE(isUnreservedBase64Url(challenge)) << challenge;
}

TEST(PkceTest, GenerateState_DiffersAcrossCallsAndFromVerifier)
{
	const std::string first = Pkce::generateState();
	const std::string second = Pkce::generateState();
	EXPECT_NE(first, second);
	EXPECT_EQ(first.size(), 22u);
	EXPECT_TRUE(isUnreservedBase64Url(first));
	EXPECT_NE(first, Pkce::generateCodeVerifier());
}

TEST(PkceTest, Base64UrlEncode_Rfc4648Vectors)
{
	const auto encode = [](const std::string &s) {
		const std::vector<unsigned char> bytes(s.begin(), s.end());
		return Pkce::base64UrlEncode(bytes);
	};

	EXPECT_EQ(encode(""), "");
	EXPECT_EQ(encode("f"), "Zg");
	EXPECT_EQ(encode("fo"), "Zm8");
	EXPECT_EQ(encode("foo"), "Zm9v");
	EXPECT_EQ(encode("foob"), "Zm9vYg");
	EXPECT_EQ(encode("fooba"), "Zm9vYmE");
	EXPECT_EQ(encode("foobar"), "Zm9vYmFy");
}

TEST(PkceTest, Base64UrlEncode_UsesUrlSafeAlphabet)
{
	const std::vector<unsigned char> bytes{0xfb, 0xff, 0xbf};
	EXPECT_EQ(Pkce::base64UrlEncode(bytes), "-_-_");
}

TEST(PkceTest, Base64UrlEncode_LongInputHasNoLineBreaks)
{
	const std::vector<unsigned char> bytes(64, 0xff);
	const std::string encoded = Pkce::base64UrlEncode(bytes);

	EXPECT_EQ(encoded.size(), 86u);
	EXPECT_EQ(encoded.find('\n'), std::string::npos);
	EXPECT_EQ(encoded, std::string(85, '_') + "w");
}
