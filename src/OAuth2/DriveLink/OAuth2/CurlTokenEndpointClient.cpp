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

#include "CurlTokenEndpointClient.hpp"

#include <stdexcept>

#include <curl/curl.h>

#include <DriveLink/CurlHelper/CurlHandle.hpp>
#include <DriveLink/CurlHelper/CurlSlistHandle.hpp>
#include <DriveLink/CurlHelper/CurlUrlSearchParams.hpp>
#include <DriveLink/CurlHelper/CurlWriteCallback.hpp>

#include "AuthError.hpp"

namespace DriveLink::OAuth2 {

CurlTokenEndpointClient::CurlTokenEndpointClient(std::string tokenEndpoint, std::chrono::seconds connectTimeout,
						 std::chrono::seconds requestTimeout,
						 std::shared_ptr<const Logger::ILogger> logger)
	: tokenEndpoint_(std::move(tokenEndpoint)),
	  connectTimeout_(connectTimeout),
	  requestTimeout_(requestTimeout),
	  logger_(logger ? std::move(logger) : throw std::invalid_argument("LoggerIsNullError(CurlTokenEndpointClient)"))
{
}

CurlTokenEndpointClient::CurlTokenEndpointClient(const OAuth2Config &config,
						 std::shared_ptr<const Logger::ILogger> logger)
	: CurlTokenEndpointClient(config.tokenEndpoint, config.connectTimeout, config.requestTimeout, std::move(logger))
{
}

TokenEndpointResponse CurlTokenEndpointClient::post(const FormFields &form)
{
	CurlHelper::CurlHandle curl;

	CurlHelper::CurlUrlSearchParams params(curl.get());
	for (const auto &[name, value] : form) {
		params.append(name, value);
	}
	const std::string postData = params.toString();

	CurlHelper::CurlSlistHandle headers;
	headers.append("Content-Type: application/x-www-form-urlencoded");
	headers.append("Accept: application/json");

	std::string responseBody;

	curl_easy_setopt(curl.get(), CURLOPT_URL, tokenEndpoint_.c_str());
	curl_easy_setopt(curl.get(), CURLOPT_POST, 1L);
	curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, postData.c_str());
	curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE, static_cast<long>(postData.length()));
	curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());

	curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, CurlHelper::CurlStringWriteCallback);
	curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &responseBody);

	curl.setTimeouts(connectTimeout_, requestTimeout_);

	const CURLcode res = curl.perform();
	if (res != CURLE_OK) {
		const std::string error = curl.errorMessage(res);
		logger_->error("CurlPerformError", {{"url", tokenEndpoint_}, {"error", error}});
		throw AuthError(AuthErrorKind::HttpRequestFailed, error);
	}

	TokenEndpointResponse response{curl.responseCode(), std::move(responseBody)};
	logger_->debug("TokenEndpointResponded", {{"status", std::to_string(response.status)}});
	return response;
}

} // namespace DriveLink::OAuth2
