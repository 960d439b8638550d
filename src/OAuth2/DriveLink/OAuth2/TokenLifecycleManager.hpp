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

#include <chrono>
#include <memory>
#include <mutex>
#include <string>

#include <DriveLink/Logger/ILogger.hpp>

#include "AuthStatus.hpp"
#include "Clock.hpp"
#include "CredentialStore.hpp"
#include "ITokenEndpointClient.hpp"

namespace DriveLink::OAuth2 {

/**
 * @brief Hands out access tokens and refreshes them shortly before they expire.
 *
 * Refreshes are serialized so concurrent callers near expiry trigger a single
 * refresh request.
 */
class TokenLifecycleManager {
public:
	static constexpr std::chrono::seconds kDefaultRefreshMargin{300};

	TokenLifecycleManager(std::shared_ptr<CredentialStore> store, std::shared_ptr<ITokenEndpointClient> tokenEndpoint,
			      std::shared_ptr<const Logger::ILogger> logger,
			      std::chrono::seconds refreshMargin = kDefaultRefreshMargin, Clock clock = systemClock());
	~TokenLifecycleManager() noexcept = default;

	TokenLifecycleManager(const TokenLifecycleManager &) = delete;
	TokenLifecycleManager &operator=(const TokenLifecycleManager &) = delete;
	TokenLifecycleManager(TokenLifecycleManager &&) = delete;
	TokenLifecycleManager &operator=(TokenLifecycleManager &&) = delete;

	/**
	 * @throws AuthError NotConfigured, NotAuthenticated, or any error of
	 *         refreshAccessToken() when the stored token is about to expire.
	 */
	[[nodiscard]]
	std::string getValidAccessToken();

	/**
	 * Forces a refresh-token grant and stores the result.
	 * @throws AuthError NotConfigured, TokenRefreshFailed, HttpRequestFailed,
	 *         InvalidResponse, StorageFailed
	 */
	std::string refreshAccessToken();

	[[nodiscard]]
	AuthStatus getAuthStatus() const;

	void logout();

private:
	std::string refreshLocked();

	const std::shared_ptr<CredentialStore> store_;
	const std::shared_ptr<ITokenEndpointClient> tokenEndpoint_;
	const std::shared_ptr<const Logger::ILogger> logger_;
	const std::chrono::seconds refreshMargin_;
	const Clock clock_;

	std::mutex refreshMutex_;
};

} // namespace DriveLink::OAuth2
