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

#include <concepts>
#include <cstddef>
#include <exception>
#include <limits>
#include <string>
#include <vector>

#include <curl/curl.h>

namespace DriveLink::CurlHelper {

template<typename T>
concept ByteContainer = requires(T &t, const char *first, const char *last) {
	t.insert(t.end(), first, last);
	requires sizeof(typename T::value_type) == 1;
};

template<ByteContainer ContainerT>
inline std::size_t CurlAppendWriteCallback(void *contents, std::size_t size, std::size_t nmemb, void *userp) noexcept
{
	if (size != 0 && nmemb > (std::numeric_limits<std::size_t>::max() / size)) {
		return CURL_WRITEFUNC_ERROR;
	}

	const std::size_t totalSize = size * nmemb;

	try {
		auto *container = static_cast<ContainerT *>(userp);
		const auto *start = static_cast<const char *>(contents);
		container->insert(container->end(), start, start + totalSize);
	} catch (const std::exception &) {
		return CURL_WRITEFUNC_ERROR;
	}

	return totalSize;
}

inline std::size_t CurlCharVectorWriteCallback(void *contents, std::size_t size, std::size_t nmemb,
					       void *userp) noexcept
{
	return CurlAppendWriteCallback<std::vector<char>>(contents, size, nmemb, userp);
}

inline std::size_t CurlStringWriteCallback(void *contents, std::size_t size, std::size_t nmemb, void *userp) noexcept
{
	return CurlAppendWriteCallback<std::string>(contents, size, nmemb, userp);
}

} // namespace DriveLink::CurlHelper
