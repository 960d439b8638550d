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

#include "AuthorizationRequestBuilder.hpp"

#include <DriveLink/CurlHelper/CurlHandle.hpp>
#include <DriveLink/CurlHelper/CurlUrlHandle.hpp>
#include <DriveLink/CurlHelper/CurlUrlSearchParams.hpp>

namespace DriveLink::OAuth2 {

AuthorizationRequestBuilder::AuthorizationRequestBuilder(OAuth2Config config) : config_(std::move(config)) {}

std::string AuthorizationRequestBuilder::build(const ClientCredentials &credentials, std::string_view state,
					       std::string_view codeChallenge) const
{
	CurlHelper::CurlHandle curl;
	CurlHelper::CurlUrlSearchParams params(curl.get());
	params.append("client_id", credentials.client_id);
	params.append("redirect_uri", config_.redirectUri);
	params.append("response_type", "code");
	params.append("scope", config_.scope);
	params.append("state", std::string(state));
	params.append("code_challenge", std::string(codeChallenge));
	params.append("code_challenge_method", "S256");
	for (const auto &[name, value] : config_.extraAuthorizationParams) {
		params.append(name, value);
	}

	CurlHelper::CurlUrlHandle urlHandle;
	urlHandle.setUrl(config_.authorizationEndpoint);
	urlHandle.appendEncodedQuery(params.toString());
	return urlHandle.toString();
}

} // namespace DriveLink::OAuth2
