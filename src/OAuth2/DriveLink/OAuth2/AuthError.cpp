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

#include "AuthError.hpp"

#include <utility>

#include <fmt/format.h>

namespace DriveLink::OAuth2 {

namespace {

std::string formatMessage(AuthErrorKind kind, const std::string &detail)
{
	if (detail.empty()) {
		return std::string(toString(kind));
	}
	return fmt::format("{}: {}", toString(kind), detail);
}

} // anonymous namespace

std::string_view toString(AuthErrorKind kind) noexcept
{
	switch (kind) {
	case AuthErrorKind::NotConfigured:
		return "NotConfigured";
	case AuthErrorKind::NotAuthenticated:
		return "NotAuthenticated";
	case AuthErrorKind::CallbackServerFailed:
		return "CallbackServerFailed";
	case AuthErrorKind::AuthorizationFailed:
		return "AuthorizationFailed";
	case AuthErrorKind::TokenExchangeFailed:
		return "TokenExchangeFailed";
	case AuthErrorKind::TokenRefreshFailed:
		return "TokenRefreshFailed";
	case AuthErrorKind::HttpRequestFailed:
		return "HttpRequestFailed";
	case AuthErrorKind::InvalidResponse:
		return "InvalidResponse";
	case AuthErrorKind::StorageFailed:
		return "StorageFailed";
	}
	return "UnknownAuthError";
}

AuthError::AuthError(AuthErrorKind kind, std::string detail)
	: std::runtime_error(formatMessage(kind, detail)),
	  kind_(kind),
	  detail_(std::move(detail))
{
}

} // namespace DriveLink::OAuth2
