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

#include "OAuth2Config.hpp"

#include <fstream>
#include <limits>
#include <stdexcept>

#include <fmt/format.h>
#include <nlohmann/json.hpp>

#include <DriveLink/CurlHelper/CurlUrlHandle.hpp>

namespace DriveLink::OAuth2 {

namespace {

void overrideString(const nlohmann::json &j, const char *key, std::string &field)
{
	if (auto it = j.find(key); it != j.end() && !it->is_null()) {
		it->get_to(field);
	}
}

void overrideSeconds(const nlohmann::json &j, const char *key, std::chrono::seconds &field)
{
	if (auto it = j.find(key); it != j.end() && !it->is_null()) {
		const auto value = it->get<std::int64_t>();
		if (value <= 0) {
			throw std::invalid_argument(std::string("NonPositiveDurationError(OAuth2Config):") + key);
		}
		field = std::chrono::seconds(value);
	}
}

/// True when `redirectUri` is an http URL on `port` whose path is `callbackPath`.
bool redirectUriMatchesListener(const std::string &redirectUri, std::uint16_t port, const std::string &callbackPath)
{
	CurlHelper::CurlUrlHandle url;
	try {
		url.setUrl(redirectUri);
		return url.getPart(CURLUPART_SCHEME) == "http" &&
		       url.getPart(CURLUPART_PORT, CURLU_DEFAULT_PORT) == std::to_string(port) &&
		       url.getPart(CURLUPART_PATH) == callbackPath;
	} catch (const std::runtime_error &) {
		return false;
	}
}

} // anonymous namespace

OAuth2Config OAuth2Config::fromJson(const nlohmann::json &j, OAuth2Config base)
{
	if (!j.is_object()) {
		throw std::invalid_argument("NotAnObjectError(OAuth2Config::fromJson)");
	}

	overrideString(j, "authorizationEndpoint", base.authorizationEndpoint);
	overrideString(j, "tokenEndpoint", base.tokenEndpoint);
	overrideString(j, "scope", base.scope);
	overrideString(j, "redirectUri", base.redirectUri);
	overrideString(j, "listenAddress", base.listenAddress);
	overrideString(j, "callbackPath", base.callbackPath);

	if (auto it = j.find("listenPort"); it != j.end() && !it->is_null()) {
		const auto port = it->get<std::int64_t>();
		if (port < 1 || port > std::numeric_limits<std::uint16_t>::max()) {
			throw std::invalid_argument("PortOutOfRangeError(OAuth2Config::fromJson)");
		}
		base.listenPort = static_cast<std::uint16_t>(port);
	}

	overrideSeconds(j, "listenerTimeoutSeconds", base.listenerTimeout);
	overrideSeconds(j, "refreshMarginSeconds", base.refreshMargin);
	overrideSeconds(j, "connectTimeoutSeconds", base.connectTimeout);
	overrideSeconds(j, "requestTimeoutSeconds", base.requestTimeout);

	if (auto it = j.find("extraAuthorizationParams"); it != j.end() && !it->is_null()) {
		base.extraAuthorizationParams.clear();
		for (const auto &[name, value] : it->items()) {
			base.extraAuthorizationParams.emplace_back(name, value.get<std::string>());
		}
	}

	if (!j.contains("redirectUri") && (j.contains("listenPort") || j.contains("callbackPath"))) {
		base.redirectUri = fmt::format("http://localhost:{}{}", base.listenPort, base.callbackPath);
	}
	if (!redirectUriMatchesListener(base.redirectUri, base.listenPort, base.callbackPath)) {
		throw std::invalid_argument("RedirectUriMismatchError(OAuth2Config::fromJson):" + base.redirectUri);
	}

	return base;
}

OAuth2Config OAuth2Config::load(const std::filesystem::path &path, const Logger::ILogger &logger)
{
	std::error_code ec;
	if (!std::filesystem::exists(path, ec)) {
		logger.info("OAuth2ConfigNotFound", {{"path", path.string()}});
		return OAuth2Config();
	}

	std::ifstream ifs(path);
	if (!ifs) {
		logger.warn("OAuth2ConfigOpenError", {{"path", path.string()}});
		return OAuth2Config();
	}

	try {
		const nlohmann::json j = nlohmann::json::parse(ifs);
		OAuth2Config config = fromJson(j);
		logger.info("OAuth2ConfigLoaded", {{"path", path.string()}});
		return config;
	} catch (const std::exception &e) {
		logger.warn("OAuth2ConfigParseError", {{"path", path.string()}, {"exception", e.what()}});
		return OAuth2Config();
	}
}

} // namespace DriveLink::OAuth2
