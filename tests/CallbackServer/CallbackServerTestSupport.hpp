/*
 * SPDX-FileCopyrightText: Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 * SPDX-License-Identifier: MIT
 *
 * DriveLink CallbackServer Library
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
#include <stdexcept>
#include <string>
#include <thread>

#include <curl/curl.h>

#include <DriveLink/CallbackServer/LoopbackCallbackListener.hpp>
#include <DriveLink/CurlHelper/CurlHandle.hpp>
#include <DriveLink/CurlHelper/CurlWriteCallback.hpp>

namespace DriveLink::CallbackServer::Testing {

struct HttpResult {
	long status = 0;
	std::string body;
};

/// Plays the browser following the redirect.
inline HttpResult httpGet(const std::string &url)
{
	CurlHelper::CurlHandle curl;
	HttpResult result;

	curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
	curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, CurlHelper::CurlStringWriteCallback);
	curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &result.body);
	curl_easy_setopt(curl.get(), CURLOPT_NOPROXY, "*");
	curl.setTimeouts(std::chrono::seconds(5), std::chrono::seconds(10));

	const CURLcode res = curl.perform();
	if (res != CURLE_OK) {
		throw std::runtime_error("CurlPerformError(httpGet):" + curl.errorMessage(res));
	}
	result.status = curl.responseCode();
	return result;
}

inline bool waitUntilStopped(const LoopbackCallbackListener &listener, std::chrono::milliseconds limit)
{
	const auto deadline = std::chrono::steady_clock::now() + limit;
	while (listener.isRunning()) {
		if (std::chrono::steady_clock::now() >= deadline) {
			return false;
		}
		std::this_thread::sleep_for(std::chrono::milliseconds(10));
	}
	return true;
}

} // namespace DriveLink::CallbackServer::Testing
