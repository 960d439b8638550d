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

#include <QByteArray>

#include <DriveLink/OAuth2/ICallbackListener.hpp>

namespace DriveLink::CallbackServer {

/// Success page closes its window after two seconds; failure pages show the escaped reason.
[[nodiscard]]
QByteArray renderCallbackPage(const OAuth2::CallbackOutcome &outcome);

[[nodiscard]]
QByteArray renderNotFoundPage();

[[nodiscard]]
QByteArray renderBadRequestPage();

/// Complete HTTP/1.1 response with `Content-Length` and `Connection: close`.
[[nodiscard]]
QByteArray buildHttpResponse(int statusCode, const QByteArray &reasonPhrase, const QByteArray &html);

} // namespace DriveLink::CallbackServer
