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

#include "TokenLifecycleManager.hpp"

#include <stdexcept>

#include "AuthError.hpp"
#include "TokenResponse.hpp"

namespace DriveLink::OAuth2 {

TokenLifecycleManager::TokenLifecycleManager(std::shared_ptr<CredentialStore> store,
					     std::shared_ptr<ITokenEndpointClient> tokenEndpoint,
					     std::shared_ptr<const Logger::ILogger> logger, std::chrono::seconds refreshMargin,
					     Clock clock)
	: store_(store ? std::move(store) : throw std::invalid_argument("StoreIsNullError(TokenLifecycleManager)")),
	  tokenEndpoint_(tokenEndpoint ? std::move(tokenEndpoint)
				       : throw std::invalid_argument("TokenEndpointIsNullError(TokenLifecycleManager)")),
	  logger_(logger ? std::move(logger) : throw std::invalid_argument("LoggerIsNullError(TokenLifecycleManager)")),
	  refreshMargin_(refreshMargin),
	  clock_(clock ? std::move(clock) : throw std::invalid_argument("ClockIsNullError(TokenLifecycleManager)"))
{
}

std::string TokenLifecycleManager::getValidAccessToken()
{
	std::scoped_lock lock(refreshMutex_);

	if (!store_->loadCredentials().has_value()) {
		throw AuthError(AuthErrorKind::NotConfigured, "Client credentials are not set");
	}

	const std::optional<TokenSet> tokenSet = store_->loadTokenSet();
	if (!tokenSet.has_value() || !tokenSet->hasAccessToken()) {
		throw AuthError(AuthErrorKind::NotAuthenticated, "No access token");
	}

	if (tokenSet->needsRefresh(clock_(), refreshMargin_)) {
		logger_->info("AccessTokenExpiring", {{"expires_at", std::to_string(*tokenSet->expires_at)}});
		return refreshLocked();
	}

	return tokenSet->access_token;
}

std::string TokenLifecycleManager::refreshAccessToken()
{
	std::scoped_lock lock(refreshMutex_);
	return refreshLocked();
}

std::string TokenLifecycleManager::refreshLocked()
{
	const std::optional<ClientCredentials> credentials = store_->loadCredentials();
	if (!credentials.has_value()) {
		throw AuthError(AuthErrorKind::NotConfigured, "Client credentials are not set");
	}

	const std::optional<TokenSet> tokenSet = store_->loadTokenSet();
	if (!tokenSet.has_value() || !tokenSet->hasRefreshToken()) {
		throw AuthError(AuthErrorKind::TokenRefreshFailed, "No refresh token");
	}

	logger_->info("AccessTokenRefreshing");

	const TokenEndpointResponse response = tokenEndpoint_->post({
		{"client_id", credentials->client_id},
		{"client_secret", credentials->client_secret},
		{"refresh_token", *tokenSet->refresh_token},
		{"grant_type", "refresh_token"},
	});

	if (!response.isSuccess()) {
		logger_->error("AccessTokenRefreshRejected", {{"status", std::to_string(response.status)}});
		throw AuthError(AuthErrorKind::TokenRefreshFailed, response.body);
	}

	const TokenResponse tokens = parseTokenResponse(response.body);
	store_->saveTokenSet(tokens.access_token, tokens.refresh_token, tokens.expires_in);

	logger_->info("AccessTokenRefreshed");
	return tokens.access_token;
}

AuthStatus TokenLifecycleManager::getAuthStatus() const
{
	return store_->loadAuthStatus();
}

void TokenLifecycleManager::logout()
{
	store_->clearTokens();
	logger_->info("LoggedOut");
}

} // namespace DriveLink::OAuth2
