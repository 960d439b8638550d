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

#include <cstdint>
#include <memory>
#include <mutex>
#include <string>

#include <DriveLink/Logger/ILogger.hpp>

#include "AuthorizationRequestBuilder.hpp"
#include "CredentialStore.hpp"
#include "FlowStateHolder.hpp"
#include "ICallbackListener.hpp"
#include "ITokenEndpointClient.hpp"
#include "OAuth2Config.hpp"

namespace DriveLink::OAuth2 {

/**
 * @brief Authorization-code with PKCE, from consent URL to stored tokens.
 *
 * startFlow() is called by the application; handleCallback() runs on the listener
 * thread. Only one attempt is live at a time: a new startFlow() stops the previous
 * listener and replaces the flow state, which makes any late callback of the old
 * attempt fail its state check.
 */
class AuthFlow {
public:
	AuthFlow(OAuth2Config config, std::shared_ptr<CredentialStore> store,
		 std::shared_ptr<ITokenEndpointClient> tokenEndpoint, std::shared_ptr<ICallbackListener> listener,
		 std::shared_ptr<const Logger::ILogger> logger);

	/// Stops the listener so no callback can reach a destroyed flow.
	~AuthFlow() noexcept;

	AuthFlow(const AuthFlow &) = delete;
	AuthFlow &operator=(const AuthFlow &) = delete;
	AuthFlow(AuthFlow &&) = delete;
	AuthFlow &operator=(AuthFlow &&) = delete;

	/**
	 * Begins a new attempt and returns the URL to open in the browser.
	 * @throws AuthError NotConfigured, CallbackServerFailed
	 */
	[[nodiscard]]
	std::string startFlow();

	/**
	 * Redeems an authorization code for the active attempt and persists the tokens.
	 * @throws AuthError NotConfigured, AuthorizationFailed, TokenExchangeFailed,
	 *         HttpRequestFailed, InvalidResponse, StorageFailed
	 */
	void exchangeCodeForTokens(const std::string &code);

	/// Verifies one redirect and exchanges its code. Never throws.
	[[nodiscard]]
	CallbackOutcome handleCallback(const CallbackParams &params) noexcept;

	/// Stops the listener and forgets the active attempt.
	void cancelFlow() noexcept;

	[[nodiscard]]
	bool hasActiveFlow() const
	{
		return flowState_->current().has_value();
	}

	[[nodiscard]]
	bool isListening() const noexcept
	{
		return listener_->isRunning();
	}

private:
	const OAuth2Config config_;
	const AuthorizationRequestBuilder requestBuilder_;
	const std::shared_ptr<CredentialStore> store_;
	const std::shared_ptr<ITokenEndpointClient> tokenEndpoint_;
	const std::shared_ptr<ICallbackListener> listener_;
	const std::shared_ptr<const Logger::ILogger> logger_;
	const std::shared_ptr<FlowStateHolder> flowState_ = std::make_shared<FlowStateHolder>();

	std::mutex startMutex_;
	std::uint64_t lastAttempt_ = 0;
};

} // namespace DriveLink::OAuth2
