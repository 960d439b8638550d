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

#include <cstddef>
#include <span>
#include <string>
#include <string_view>

namespace DriveLink::OAuth2::Pkce {

/// Base64url (RFC 4648 section 5) without `=` padding.
[[nodiscard]]
std::string base64UrlEncode(std::span<const unsigned char> data);

/// 32 bytes from the OpenSSL CSPRNG, encoded to a 43-character verifier.
[[nodiscard]]
std::string generateCodeVerifier();

/// S256 challenge: base64url(SHA-256(ASCII bytes of the verifier)).
[[nodiscard]]
std::string generateCodeChallenge(std::string_view codeVerifier);

/// 16 random bytes, base64url encoded. Used as the anti-CSRF `state`.
[[nodiscard]]
std::string generateState();

} // namespace DriveLink::OAuth2::Pkce
