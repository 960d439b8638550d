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

#include <stdexcept>
#include <string>
#include <string_view>

namespace DriveLink::OAuth2 {

enum class AuthErrorKind {
	NotConfigured,
	NotAuthenticated,
	CallbackServerFailed,
	AuthorizationFailed,
	TokenExchangeFailed,
	TokenRefreshFailed,
	HttpRequestFailed,
	InvalidResponse,
	StorageFailed,
};

[[nodiscard]]
std::string_view toString(AuthErrorKind kind) noexcept;

/**
 * @brief Every failure of the authorization subsystem that a caller can act on.
 *
 * `detail` carries the upstream payload where one exists (the token endpoint's
 * response body for TokenExchangeFailed and TokenRefreshFailed, the libcurl error
 * string for HttpRequestFailed).
 */
class AuthError : public std::runtime_error {
public:
	explicit AuthError(AuthErrorKind kind, std::string detail = {});

	[[nodiscard]]
	AuthErrorKind kind() const noexcept
	{
		return kind_;
	}

	[[nodiscard]]
	const std::string &detail() const noexcept
	{
		return detail_;
	}

private:
	AuthErrorKind kind_;
	std::string detail_;
};

} // namespace DriveLink::OAuth2
