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

#include <string>
#include <string_view>

#include "ClientCredentials.hpp"
#include "OAuth2Config.hpp"

namespace DriveLink::OAuth2 {

class AuthorizationRequestBuilder {
public:
	explicit AuthorizationRequestBuilder(OAuth2Config config);

	/**
	 * Builds the consent URL on the configured authorization endpoint. Parameter
	 * order: client_id, redirect_uri, response_type, scope, state, code_challenge,
	 * code_challenge_method, then the configured extras.
	 */
	[[nodiscard]]
	std::string build(const ClientCredentials &credentials, std::string_view state,
			  std::string_view codeChallenge) const;

private:
	const OAuth2Config config_;
};

} // namespace DriveLink::OAuth2
