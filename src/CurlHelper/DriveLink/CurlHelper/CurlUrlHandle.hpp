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

#include <memory>
#include <stdexcept>
#include <string>

#include <curl/curl.h>

namespace DriveLink::CurlHelper {

class CurlUrlHandle {
public:
	CurlUrlHandle() : handle_(curl_url(), &curl_url_cleanup)
	{
		if (!handle_) {
			throw std::runtime_error("InitError(CurlUrlHandle)");
		}
	}

	~CurlUrlHandle() noexcept = default;

	CurlUrlHandle(const CurlUrlHandle &) = delete;
	CurlUrlHandle &operator=(const CurlUrlHandle &) = delete;
	CurlUrlHandle(CurlUrlHandle &&) = delete;
	CurlUrlHandle &operator=(CurlUrlHandle &&) = delete;

	void setUrl(const std::string &url)
	{
		const CURLUcode uc = curl_url_set(handle_.get(), CURLUPART_URL, url.c_str(), 0);
		if (uc != CURLUE_OK) {
			throw std::runtime_error("UrlParseError(CurlUrlHandle::setUrl):" + url);
		}
	}

	/// Appends an already percent-encoded query string such as `a=1&b=2`.
	void appendEncodedQuery(const std::string &query)
	{
		const CURLUcode uc = curl_url_set(handle_.get(), CURLUPART_QUERY, query.c_str(), CURLU_APPENDQUERY);
		if (uc != CURLUE_OK) {
			throw std::runtime_error("QueryAppendError(CurlUrlHandle::appendEncodedQuery)");
		}
	}

	/// One component of the URL, decoded only where `flags` ask for it.
	[[nodiscard]]
	std::string getPart(CURLUPart part, unsigned int flags = 0) const
	{
		char *value = nullptr;
		const CURLUcode uc = curl_url_get(handle_.get(), part, &value, flags);
		if (uc != CURLUE_OK || !value) {
			throw std::runtime_error("GetPartError(CurlUrlHandle::getPart)");
		}
		const std::unique_ptr<char, decltype(&curl_free)> guard(value, &curl_free);
		return std::string(value);
	}

	[[nodiscard]]
	std::string toString() const
	{
		return getPart(CURLUPART_URL);
	}

private:
	std::unique_ptr<CURLU, decltype(&curl_url_cleanup)> handle_;
};

} // namespace DriveLink::CurlHelper
