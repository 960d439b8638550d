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

#include "CallbackRequest.hpp"

#include <QRegularExpression>
#include <QString>
#include <QUrlQuery>

namespace DriveLink::CallbackServer {

namespace {

std::optional<std::string> queryValue(const QUrlQuery &query, const QString &key)
{
	if (!query.hasQueryItem(key)) {
		return std::nullopt;
	}
	return query.queryItemValue(key, QUrl::FullyDecoded).toStdString();
}

} // anonymous namespace

std::optional<QUrl> parseRequestTarget(const QByteArray &request)
{
	static const QRegularExpression re("^GET\\s+(/\\S*)\\s+HTTP/\\d");
	const QRegularExpressionMatch match = re.match(QString::fromUtf8(request));
	if (!match.hasMatch()) {
		return std::nullopt;
	}

	QUrl url(QStringLiteral("http://localhost") + match.captured(1), QUrl::StrictMode);
	if (!url.isValid()) {
		return std::nullopt;
	}
	return url;
}

OAuth2::CallbackParams parseCallbackParams(const QUrl &url)
{
	const QUrlQuery query(url);

	OAuth2::CallbackParams params;
	params.code = queryValue(query, QStringLiteral("code"));
	params.state = queryValue(query, QStringLiteral("state"));
	params.error = queryValue(query, QStringLiteral("error"));
	params.errorDescription = queryValue(query, QStringLiteral("error_description"));
	return params;
}

} // namespace DriveLink::CallbackServer
