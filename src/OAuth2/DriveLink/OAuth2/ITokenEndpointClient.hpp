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
#include <utility>
#include <vector>

namespace DriveLink::OAuth2 {

using FormFields = std::vector<std::pair<std::string, std::string>>;

struct TokenEndpointResponse {
	long status = 0;
	std::string body;

	[[nodiscard]]
	bool isSuccess() const noexcept
	{
		return status >= 200 && status < 300;
	}
};

/**
 * @brief One form-encoded POST to the provider's token endpoint.
 *
 * Any HTTP status is returned as a response; only transport failures throw
 * (AuthError HttpRequestFailed).
 */
class ITokenEndpointClient {
public:
	ITokenEndpointClient() noexcept = default;
	virtual ~ITokenEndpointClient() = default;

	ITokenEndpointClient(const ITokenEndpointClient &) = delete;
	ITokenEndpointClient &operator=(const ITokenEndpointClient &) = delete;
	ITokenEndpointClient(ITokenEndpointClient &&) = delete;
	ITokenEndpointClient &operator=(ITokenEndpointClient &&) = delete;

	[[nodiscard]]
	virtual TokenEndpointResponse post(const FormFields &form) = 0;
};

} // namespace DriveLink::OAuth2
