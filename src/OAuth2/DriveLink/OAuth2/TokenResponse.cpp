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

#include "TokenResponse.hpp"

#include <cstdint>

#include "AuthError.hpp"

namespace DriveLink::OAuth2 {

namespace {

bool isAcceptableExpiresIn(const nlohmann::json &value)
{
	if (value.is_number_unsigned()) {
		return value.get<std::uint64_t>() <= static_cast<std::uint64_t>(kMaxExpiresInSeconds);
	}
	if (value.is_number_integer()) {
		const auto seconds = value.get<std::int64_t>();
		return seconds >= 0 && seconds <= kMaxExpiresInSeconds;
	}
	return false;
}

} // anonymous namespace

TokenResponse parseTokenResponse(const std::string &body)
{
	const nlohmann::json j = nlohmann::json::parse(body, nullptr, false);
	if (j.is_discarded() || !j.is_object()) {
		throw AuthError(AuthErrorKind::InvalidResponse, "Token response is not a JSON object");
	}

	if (auto it = j.find("expires_in"); it != j.end() && !it->is_null() && !isAcceptableExpiresIn(*it)) {
		throw AuthError(AuthErrorKind::InvalidResponse, "expires_in is not an integer in range: " + it->dump());
	}

	TokenResponse response;
	try {
		response = j.get<TokenResponse>();
	} catch (const nlohmann::json::exception &e) {
		throw AuthError(AuthErrorKind::InvalidResponse, e.what());
	}

	if (response.access_token.empty()) {
		throw AuthError(AuthErrorKind::InvalidResponse, "access_token is empty");
	}
	return response;
}

} // namespace DriveLink::OAuth2
