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

#include <atomic>
#include <chrono>
#include <cstdint>
#include <future>
#include <memory>
#include <mutex>
#include <stop_token>
#include <string>
#include <thread>

#include <QByteArray>

#include <DriveLink/Logger/ILogger.hpp>
#include <DriveLink/OAuth2/ICallbackListener.hpp>
#include <DriveLink/OAuth2/OAuth2Config.hpp>

class QTcpSocket;

namespace DriveLink::CallbackServer {

struct LoopbackCallbackListenerOptions {
	std::string address = "127.0.0.1";
	/// 0 binds an ephemeral port; see LoopbackCallbackListener::boundPort().
	std::uint16_t port = 8585;
	std::string callbackPath = "/callback";
	std::chrono::milliseconds timeout{std::chrono::minutes(5)};
	std::chrono::milliseconds pollInterval{100};
	std::chrono::milliseconds readTimeout{std::chrono::seconds(10)};

	[[nodiscard]]
	static LoopbackCallbackListenerOptions fromConfig(const OAuth2::OAuth2Config &config);
};

/**
 * @brief Single-shot HTTP listener for the authorization redirect.
 *
 * Each start() spawns a std::jthread that owns a blocking QTcpServer. The worker
 * answers unrelated paths with 404 and keeps waiting; the first request to the
 * callback path is passed to the handler, answered with the rendered page, and
 * ends the run. A run without a callback ends silently after the timeout.
 *
 * All waits are sliced by pollInterval so stop() returns promptly.
 */
class LoopbackCallbackListener final : public OAuth2::ICallbackListener {
public:
	LoopbackCallbackListener(LoopbackCallbackListenerOptions options, std::shared_ptr<const Logger::ILogger> logger);
	~LoopbackCallbackListener() noexcept override;

	void start(OAuth2::CallbackHandler handler) override;
	void stop() noexcept override;

	[[nodiscard]]
	bool isRunning() const noexcept override
	{
		return running_.load();
	}

	/// Port of the current or last run, 0 before the first successful bind.
	[[nodiscard]]
	std::uint16_t boundPort() const noexcept
	{
		return boundPort_.load();
	}

private:
	void run(std::stop_token stopToken, const OAuth2::CallbackHandler &handler, std::promise<void> &bound);

	/// Returns true when the request was the callback and the run is over.
	bool serveConnection(std::stop_token stopToken, QTcpSocket &socket, const OAuth2::CallbackHandler &handler);

	void respond(QTcpSocket &socket, int statusCode, const QByteArray &reasonPhrase, const QByteArray &html);

	const LoopbackCallbackListenerOptions options_;
	const std::shared_ptr<const Logger::ILogger> logger_;

	std::mutex mutex_;
	std::jthread thread_;
	std::atomic<bool> running_{false};
	std::atomic<std::uint16_t> boundPort_{0};
};

} // namespace DriveLink::CallbackServer
