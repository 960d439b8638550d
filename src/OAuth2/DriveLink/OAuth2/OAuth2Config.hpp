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
#include <cstdint>
#include <filesystem>
#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json_fwd.hpp>

#include <DriveLink/Logger/ILogger.hpp>

namespace DriveLink::OAuth2 {

struct OAuth2Config {
	std::string authorizationEndpoint = "https://accounts.google.com/o/oauth2/v2/auth";
	std::string tokenEndpoint = "https://oauth2.googleapis.com/token";
	std::string scope = "https://www.googleapis.com/auth/drive.readonly";

	std::string redirectUri = "http://localhost:8585/callback";
	std::string listenAddress = "127.0.0.1";
	std::uint16_t listenPort = 8585;
	std::string callbackPath = "/callback";

	std::chrono::seconds listenerTimeout{300};
	std::chrono::seconds refreshMargin{300};
	std::chrono::seconds connectTimeout{10};
	std::chrono::seconds requestTimeout{60};

	/// Appended after the PKCE parameters; the defaults ask Google for a refresh token.
	std::vector<std::pair<std::string, std::string>> extraAuthorizationParams = {
		{"access_type", "offline"},
		{"prompt", "consent"},
	};

	/**
	 * Returns a copy of `base` with every recognized key of `j` applied.
	 * Unknown keys are ignored. When `listenPort` or `callbackPath` is given without
	 * `redirectUri`, the redirect URI is rebuilt as `http://localhost:<port><path>`.
	 * @throws nlohmann::json::exception on a recognized key with the wrong type.
	 * @throws std::invalid_argument on a non-positive duration, an out of range port,
	 *         or a redirect URI whose port or path is not the one the listener serves.
	 */
	[[nodiscard]]
	static OAuth2Config fromJson(const nlohmann::json &j, OAuth2Config base = {});

	/**
	 * Loads overrides from a JSON file. A missing file yields the defaults; an
	 * unreadable or malformed file is logged and also yields the defaults.
	 */
	[[nodiscard]]
	static OAuth2Config load(const std::filesystem::path &path, const Logger::ILogger &logger);
};

} // namespace DriveLink::OAuth2
