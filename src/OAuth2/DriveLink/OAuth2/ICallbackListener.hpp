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

#include <functional>
#include <optional>
#include <string>

namespace DriveLink::OAuth2 {

/// Percent-decoded query parameters of one redirect to the callback path.
struct CallbackParams {
	std::optional<std::string> code;
	std::optional<std::string> state;
	std::optional<std::string> error;
	std::optional<std::string> errorDescription;
};

enum class CallbackResult {
	Authorized,
	ProviderError,
	StateMismatch,
	MissingCode,
	ExchangeFailed,
};

/// What the browser is told about one callback.
struct CallbackOutcome {
	CallbackResult result = CallbackResult::MissingCode;
	std::string message;

	[[nodiscard]]
	bool succeeded() const noexcept
	{
		return result == CallbackResult::Authorized;
	}
};

/// Invoked on the listener thread. Must not throw.
using CallbackHandler = std::function<CallbackOutcome(const CallbackParams &)>;

/**
 * @brief Background receiver of the single authorization redirect.
 *
 * start() returns once the listener accepts connections and throws
 * AuthError CallbackServerFailed when it cannot. Starting a running listener
 * stops the previous run first.
 */
class ICallbackListener {
public:
	ICallbackListener() noexcept = default;
	virtual ~ICallbackListener() = default;

	ICallbackListener(const ICallbackListener &) = delete;
	ICallbackListener &operator=(const ICallbackListener &) = delete;
	ICallbackListener(ICallbackListener &&) = delete;
	ICallbackListener &operator=(ICallbackListener &&) = delete;

	virtual void start(CallbackHandler handler) = 0;

	/// Requests the worker to stop and joins it. No-op when idle.
	virtual void stop() noexcept = 0;

	[[nodiscard]]
	virtual bool isRunning() const noexcept = 0;
};

} // namespace DriveLink::OAuth2
