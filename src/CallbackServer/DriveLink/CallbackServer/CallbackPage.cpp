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

#include "CallbackPage.hpp"

#include <QString>

namespace DriveLink::CallbackServer {

namespace {

QByteArray renderDocument(const QString &title, const QString &body)
{
	return QStringLiteral("<!DOCTYPE html>\n"
			      "<html><head><meta charset=\"utf-8\"><title>%1</title></head>\n"
			      "<body>%2</body></html>\n")
		.arg(title.toHtmlEscaped(), body)
		.toUtf8();
}

} // anonymous namespace

QByteArray renderCallbackPage(const OAuth2::CallbackOutcome &outcome)
{
	if (outcome.succeeded()) {
		return renderDocument(QStringLiteral("Authentication successful"),
				      QStringLiteral("<h1>Authentication successful</h1>"
						     "<p>You can close this window now.</p>"
						     "<script>setTimeout(function () { window.close(); }, 2000);</script>"));
	}

	const QString reason = QString::fromStdString(outcome.message).toHtmlEscaped();
	return renderDocument(QStringLiteral("Authentication failed"),
			      QStringLiteral("<h1>Authentication failed</h1><p>%1</p>").arg(reason));
}

QByteArray renderNotFoundPage()
{
	return renderDocument(QStringLiteral("Not Found"), QStringLiteral("<h1>Not Found</h1>"));
}

QByteArray renderBadRequestPage()
{
	return renderDocument(QStringLiteral("Bad Request"), QStringLiteral("<h1>Bad Request</h1>"));
}

QByteArray buildHttpResponse(int statusCode, const QByteArray &reasonPhrase, const QByteArray &html)
{
	QByteArray response;
	response += "HTTP/1.1 " + QByteArray::number(statusCode) + " " + reasonPhrase + "\r\n";
	response += "Content-Type: text/html; charset=utf-8\r\n";
	response += "Content-Length: " + QByteArray::number(html.size()) + "\r\n";
	response += "Cache-Control: no-store\r\n";
	response += "Connection: close\r\n";
	response += "\r\n";
	response += html;
	return response;
}

} // namespace DriveLink::CallbackServer
