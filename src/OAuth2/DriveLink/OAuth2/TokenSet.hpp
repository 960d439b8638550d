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

#include <chrono>
#include <optional>
#include <string>

#include <nlohmann/json_fwd.hpp>

#include "Clock.hpp"

namespace DriveLink::OAuth2 {

struct TokenSet {
	std::string access_token;
	std::optional<std::string> refresh_token;
	std::optional<Timestamp> expires_at;

	[[nodiscard]]
	bool hasAccessToken() const noexcept
	{
		return !access_token.empty();
	}

	[[nodiscard]]
	bool hasRefreshToken() const noexcept
	{
		return refresh_token.has_value() && !refresh_token->empty();
	}

	/**
	 * True when the access token expires at or before `now + margin`.
	 * A token without a recorded expiry never needs refreshing.
	 */
	[[nodiscard]]
	bool needsRefresh(std::chrono::system_clock::time_point now, std::chrono::seconds margin) const noexcept;
};

void to_json(nlohmann::json &j, const TokenSet &p);
void from_json(const nlohmann::json &j, TokenSet &p);

} // namespace DriveLink::OAuth2
