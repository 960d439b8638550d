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
#include <memory>
#include <string>

#include <DriveLink/Logger/ILogger.hpp>

#include "ITokenEndpointClient.hpp"
#include "OAuth2Config.hpp"

namespace DriveLink::OAuth2 {

class CurlTokenEndpointClient final : public ITokenEndpointClient {
public:
	CurlTokenEndpointClient(std::string tokenEndpoint, std::chrono::seconds connectTimeout,
				std::chrono::seconds requestTimeout, std::shared_ptr<const Logger::ILogger> logger);

	CurlTokenEndpointClient(const OAuth2Config &config, std::shared_ptr<const Logger::ILogger> logger);

	~CurlTokenEndpointClient() noexcept override = default;

	TokenEndpointResponse post(const FormFields &form) override;

private:
	const std::string tokenEndpoint_;
	const std::chrono::seconds connectTimeout_;
	const std::chrono::seconds requestTimeout_;
	const std::shared_ptr<const Logger::ILogger> logger_;
};

} // namespace DriveLink::OAuth2
