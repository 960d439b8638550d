/*
 * SPDX-FileCopyrightText: Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 * SPDX-License-Identifier: MIT
 *
 * DriveLink CurlHelper Library
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

#include <array>
#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>

#include <curl/curl.h>

namespace DriveLink::CurlHelper {

/**
 * @brief Owns one libcurl easy handle configured for use off the main thread.
 *
 * Every handle starts with signals disabled and TLS peer and host verification on,
 * and records transfer errors into its own buffer. An easy handle must not be used
 * by two threads at once, so callers that may run on the callback listener thread
 * and on the caller thread create one handle per transfer.
 */
class CurlHandle {
	[[nodiscard]]
	static auto createCurlHandle()
	{
		CURL *curl = curl_easy_init();
		if (!curl)
			throw std::runtime_error("CurlInitError(CurlHandle)");
		return std::unique_ptr<CURL, decltype(&curl_easy_cleanup)>(curl, &curl_easy_cleanup);
	}

public:
	CurlHandle() : curl_(createCurlHandle())
	{
		curl_easy_setopt(curl_.get(), CURLOPT_NOSIGNAL, 1L);
		curl_easy_setopt(curl_.get(), CURLOPT_SSL_VERIFYPEER, 1L);
		curl_easy_setopt(curl_.get(), CURLOPT_SSL_VERIFYHOST, 2L);
		curl_easy_setopt(curl_.get(), CURLOPT_ERRORBUFFER, errorBuffer_.data());
	}

	~CurlHandle() noexcept = default;

	CurlHandle(const CurlHandle &) = delete;
	CurlHandle &operator=(const CurlHandle &) = delete;
	CurlHandle(CurlHandle &&) = delete;
	CurlHandle &operator=(CurlHandle &&) = delete;

	[[nodiscard]]
	CURL *get() const noexcept
	{
		return curl_.get();
	}

	void setTimeouts(std::chrono::seconds connectTimeout, std::chrono::seconds requestTimeout) noexcept
	{
		curl_easy_setopt(curl_.get(), CURLOPT_CONNECTTIMEOUT, static_cast<long>(connectTimeout.count()));
		curl_easy_setopt(curl_.get(), CURLOPT_TIMEOUT, static_cast<long>(requestTimeout.count()));
	}

	[[nodiscard]]
	CURLcode perform() noexcept
	{
		errorBuffer_[0] = '\0';
		return curl_easy_perform(curl_.get());
	}

	/// The detailed message of the last failed perform(), or the generic text for `code`.
	[[nodiscard]]
	std::string errorMessage(CURLcode code) const
	{
		return errorBuffer_[0] != '\0' ? std::string(errorBuffer_.data()) : std::string(curl_easy_strerror(code));
	}

	[[nodiscard]]
	long responseCode() const noexcept
	{
		long status = 0;
		curl_easy_getinfo(curl_.get(), CURLINFO_RESPONSE_CODE, &status);
		return status;
	}

private:
	std::unique_ptr<CURL, decltype(&curl_easy_cleanup)> curl_;
	std::array<char, CURL_ERROR_SIZE> errorBuffer_{};
};

} // namespace DriveLink::CurlHelper
