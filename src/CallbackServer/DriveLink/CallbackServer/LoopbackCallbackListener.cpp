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

#include "LoopbackCallbackListener.hpp"

#include <algorithm>
#include <stdexcept>

#include <QHostAddress>
#include <QString>
#include <QTcpServer>
#include <QTcpSocket>

#include <DriveLink/OAuth2/AuthError.hpp>

#include "CallbackPage.hpp"
#include "CallbackRequest.hpp"

namespace DriveLink::CallbackServer {

namespace {

constexpr qsizetype kMaxRequestHeaderBytes = 16 * 1024;
constexpr int kWriteTimeoutMs = 2000;

int sliceMs(std::chrono::steady_clock::time_point deadline, std::chrono::milliseconds pollInterval)
{
	const auto remaining =
		std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
	return static_cast<int>(std::clamp(remaining, std::chrono::milliseconds(0), pollInterval).count());
}

} // anonymous namespace

LoopbackCallbackListenerOptions LoopbackCallbackListenerOptions::fromConfig(const OAuth2::OAuth2Config &config)
{
	LoopbackCallbackListenerOptions options;
	options.address = config.listenAddress;
	options.port = config.listenPort;
	options.callbackPath = config.callbackPath;
	options.timeout = config.listenerTimeout;
	return options;
}

LoopbackCallbackListener::LoopbackCallbackListener(LoopbackCallbackListenerOptions options,
						   std::shared_ptr<const Logger::ILogger> logger)
	: options_(std::move(options)),
	  logger_(logger ? std::move(logger) : throw std::invalid_argument("LoggerIsNullError(LoopbackCallbackListener)"))
{
}

LoopbackCallbackListener::~LoopbackCallbackListener() noexcept
{
	stop();
}

void LoopbackCallbackListener::start(OAuth2::CallbackHandler handler)
{
	if (!handler) {
		throw std::invalid_argument("HandlerIsNullError(LoopbackCallbackListener::start)");
	}

	std::scoped_lock lock(mutex_);

	if (thread_.joinable()) {
		thread_.request_stop();
		thread_.join();
	}

	std::promise<void> bound;
	std::future<void> boundFuture = bound.get_future();

	running_ = true;
	thread_ = std::jthread(
		[this, handler = std::move(handler), bound = std::move(bound)](std::stop_token stopToken) mutable {
			run(stopToken, handler, bound);
			running_ = false;
		});

	try {
		boundFuture.get();
	} catch (const OAuth2::AuthError &) {
		thread_.join();
		throw;
	}
}

void LoopbackCallbackListener::stop() noexcept
{
	std::scoped_lock lock(mutex_);

	if (!thread_.joinable()) {
		return;
	}

	thread_.request_stop();
	if (thread_.get_id() == std::this_thread::get_id()) {
		thread_.detach();
		return;
	}
	thread_.join();
}

void LoopbackCallbackListener::run(std::stop_token stopToken, const OAuth2::CallbackHandler &handler,
				   std::promise<void> &bound)
{
	QTcpServer server;
	const QHostAddress address(QString::fromStdString(options_.address));

	if (address.isNull() || !server.listen(address, options_.port)) {
		const std::string error = address.isNull() ? "Invalid listen address: " + options_.address
							   : server.errorString().toStdString();
		logger_->error("CallbackServerListenError", {{"address", options_.address},
							      {"port", std::to_string(options_.port)},
							      {"error", error}});
		bound.set_exception(std::make_exception_ptr(
			OAuth2::AuthError(OAuth2::AuthErrorKind::CallbackServerFailed, error)));
		return;
	}

	boundPort_ = server.serverPort();
	logger_->info("CallbackServerListening",
		      {{"address", options_.address}, {"port", std::to_string(server.serverPort())}});
	bound.set_value();

	const auto deadline = std::chrono::steady_clock::now() + options_.timeout;
	bool served = false;

	while (!served && !stopToken.stop_requested()) {
		if (std::chrono::steady_clock::now() >= deadline) {
			logger_->info("CallbackServerTimedOut");
			break;
		}

		bool timedOut = false;
		if (!server.waitForNewConnection(sliceMs(deadline, options_.pollInterval), &timedOut)) {
			if (timedOut) {
				continue;
			}
			logger_->error("CallbackServerAcceptError", {{"error", server.errorString().toStdString()}});
			break;
		}

		const std::unique_ptr<QTcpSocket> socket(server.nextPendingConnection());
		if (!socket) {
			continue;
		}

		try {
			served = serveConnection(stopToken, *socket, handler);
		} catch (const std::exception &e) {
			logger_->error("CallbackServerRequestError", {{"exception", e.what()}});
		}
	}

	server.close();

	if (stopToken.stop_requested() && !served) {
		logger_->info("CallbackServerStopped");
	}
}

bool LoopbackCallbackListener::serveConnection(std::stop_token stopToken, QTcpSocket &socket,
					       const OAuth2::CallbackHandler &handler)
{
	const auto readDeadline = std::chrono::steady_clock::now() + options_.readTimeout;

	QByteArray request;
	while (!request.contains("\r\n\r\n") && request.size() < kMaxRequestHeaderBytes) {
		if (stopToken.stop_requested() || std::chrono::steady_clock::now() >= readDeadline) {
			logger_->warn("CallbackServerReadTimeout");
			return false;
		}

		if (socket.bytesAvailable() == 0 &&
		    !socket.waitForReadyRead(sliceMs(readDeadline, options_.pollInterval))) {
			if (socket.state() != QAbstractSocket::ConnectedState) {
				break;
			}
			continue;
		}
		request += socket.readAll();
	}

	const std::optional<QUrl> url = parseRequestTarget(request);
	if (!url.has_value()) {
		logger_->warn("CallbackServerBadRequest");
		respond(socket, 400, "Bad Request", renderBadRequestPage());
		return false;
	}

	const std::string path = url->path(QUrl::FullyDecoded).toStdString();
	if (path != options_.callbackPath) {
		logger_->debug("CallbackServerPathNotFound", {{"path", path}});
		respond(socket, 404, "Not Found", renderNotFoundPage());
		return false;
	}

	const OAuth2::CallbackParams params = parseCallbackParams(*url);
	logger_->info("CallbackReceived", {{"has_code", params.code ? "true" : "false"},
					   {"has_error", params.error ? "true" : "false"}});

	OAuth2::CallbackOutcome outcome;
	try {
		outcome = handler(params);
	} catch (const std::exception &e) {
		logger_->error("CallbackHandlerError", {{"exception", e.what()}});
		outcome = {OAuth2::CallbackResult::ExchangeFailed, e.what()};
	}

	respond(socket, 200, "OK", renderCallbackPage(outcome));
	return true;
}

void LoopbackCallbackListener::respond(QTcpSocket &socket, int statusCode, const QByteArray &reasonPhrase,
				       const QByteArray &html)
{
	socket.write(buildHttpResponse(statusCode, reasonPhrase, html));
	while (socket.bytesToWrite() > 0) {
		if (!socket.waitForBytesWritten(kWriteTimeoutMs)) {
			logger_->warn("CallbackServerWriteError", {{"error", socket.errorString().toStdString()}});
			break;
		}
	}

	socket.disconnectFromHost();
	if (socket.state() != QAbstractSocket::UnconnectedState) {
		socket.waitForDisconnected(kWriteTimeoutMs);
	}
}

} // namespace DriveLink::CallbackServer
