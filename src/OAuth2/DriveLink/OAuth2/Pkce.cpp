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

#include "Pkce.hpp"

#include <array>
#include <memory>
#include <stdexcept>

#include <openssl/evp.h>
#include <openssl/rand.h>

namespace DriveLink::OAuth2::Pkce {

namespace {

constexpr std::size_t kVerifierEntropyBytes = 32;
constexpr std::size_t kStateEntropyBytes = 16;

template<std::size_t N> std::array<unsigned char, N> randomBytes()
{
	std::array<unsigned char, N> buffer{};
	if (RAND_bytes(buffer.data(), static_cast<int>(buffer.size())) != 1) {
		throw std::runtime_error("RandBytesError(Pkce)");
	}
	return buffer;
}

} // anonymous namespace

std::string base64UrlEncode(std::span<const unsigned char> data)
{
	if (data.empty()) {
		return {};
	}

	// EVP_EncodeBlock writes 4 characters per 3 input bytes plus a terminating NUL.
	std::string out(4 * ((data.size() + 2) / 3) + 1, '\0');
	const int written = EVP_EncodeBlock(reinterpret_cast<unsigned char *>(out.data()), data.data(),
					    static_cast<int>(data.size()));
	if (written < 0) {
		throw std::runtime_error("EncodeError(Pkce::base64UrlEncode)");
	}
	out.resize(static_cast<std::size_t>(written));

	while (!out.empty() && out.back() == '=') {
		out.pop_back();
	}
	for (char &c : out) {
		if (c == '+') {
			c = '-';
		} else if (c == '/') {
			c = '_';
		}
	}
	return out;
}

std::string generateCodeVerifier()
{
	const auto bytes = randomBytes<kVerifierEntropyBytes>();
	return base64UrlEncode(bytes);
}

std::string generateCodeChallenge(std::string_view codeVerifier)
{
	const std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
	if (!ctx) {
		throw std::runtime_error("DigestInitError(Pkce::generateCodeChallenge)");
	}

	std::array<unsigned char, EVP_MAX_MD_SIZE> digest{};
	unsigned int digestLength = 0;

	if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1 ||
	    EVP_DigestUpdate(ctx.get(), codeVerifier.data(), codeVerifier.size()) != 1 ||
	    EVP_DigestFinal_ex(ctx.get(), digest.data(), &digestLength) != 1) {
		throw std::runtime_error("DigestError(Pkce::generateCodeChallenge)");
	}

	return base64UrlEncode(std::span<const unsigned char>(digest.data(), digestLength));
}

std::string generateState()
{
	const auto bytes = randomBytes<kStateEntropyBytes>();
	return base64UrlEncode(bytes);
}

} // namespace DriveLink::OAuth2::Pkce
