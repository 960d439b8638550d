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

#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace DriveLink::OAuth2 {

/// Longest lifetime accepted for an access token, ten years in seconds.
inline constexpr std::int64_t kMaxExpiresInSeconds = 10LL * 365 * 24 * 60 * 60;

/// Successful body of the token endpoint for both grant types.
struct TokenResponse {
	std::string access_token;
	std::optional<std::string> refresh_token;
	std::optional<std::int64_t> expires_in;
	std::optional<std::string> token_type;
	std::optional<std::string> scope;
};

inline void from_json(const nlohmann::json &j, TokenResponse &p)
{
	j.at("access_token").get_to(p.access_token);

	const auto set_optional = [&j](const char *key, auto &field) {
		if (auto it = j.find(key); it != j.end() && !it->is_null()) {
			it->get_to(field.emplace());
		} else {
			field = std::nullopt;
		}
	};

	set_optional("refresh_token", p.refresh_token);
	set_optional("expires_in", p.expires_in);
	set_optional("token_type", p.token_type);
	set_optional("scope", p.scope);
}

/**
 * Parses a 2xx token endpoint body.
 * @throws AuthError InvalidResponse when the body is not JSON, is not an object,
 *         lacks a non-empty `access_token`, or carries an `expires_in` that is not
 *         an integer in [0, kMaxExpiresInSeconds].
 */
[[nodiscard]]
TokenResponse parseTokenResponse(const std::string &body);

} // namespace DriveLink::OAuth2
