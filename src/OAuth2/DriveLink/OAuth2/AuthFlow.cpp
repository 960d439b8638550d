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

#include "AuthFlow.hpp"

#include <stdexcept>
#include <string>

#include "AuthError.hpp"
#include "Pkce.hpp"
#include "TokenResponse.hpp"

namespace DriveLink::OAuth2 {

AuthFlow::AuthFlow(OAuth2Config config, std::shared_ptr<CredentialStore> store,
		   std::shared_ptr<ITokenEndpointClient> tokenEndpoint, std::shared_ptr<ICallbackListener> listener,
		   std::shared_ptr<const Logger::ILogger> logger)
	: config_(std::move(config)),
	  requestBuilder_(config_),
	  store_(store ? std::move(store) : throw std::invalid_argument("StoreIsNullError(AuthFlow)")),
	  tokenEndpoint_(tokenEndpoint ? std::move(tokenEndpoint)
				       : throw std::invalid_argument("TokenEndpointIsNullError(AuthFlow)")),
	  listener_(listener ? std::move(listener) : throw std::invalid_argument("ListenerIsNullError(AuthFlow)")),
	  logger_(logger ? std::move(logger) : throw std::invalid_argument("LoggerIsNullError(AuthFlow)"))
{
}

AuthFlow::~AuthFlow() noexcept
{
	listener_->stop();
}

std::string AuthFlow::startFlow()
{
	std::scoped_lock lock(startMutex_);

	const std::optional<ClientCredentials> credentials = store_->loadCredentials();
	if (!credentials.has_value()) {
		throw AuthError(AuthErrorKind::NotConfigured, "Client credentials are not set");
	}

	std::string codeVerifier = Pkce::generateCodeVerifier();
	const std::string codeChallenge = Pkce::generateCodeChallenge(codeVerifier);
	std::string state = Pkce::generateState();

	if (listener_->isRunning()) {
		logger_->info("AuthFlowSuperseded", {{"attempt", std::to_string(lastAttempt_)}});
	}
	listener_->stop();

	const std::string url = requestBuilder_.build(*credentials, state, codeChallenge);
	const std::uint64_t attempt = ++lastAttempt_;
	flowState_->replace(FlowState{std::move(codeVerifier), std::move(state), attempt});

	try {
		listener_->start([this](const CallbackParams &params) { return handleCallback(params); });
	} catch (const AuthError &) {
		flowState_->clear();
		throw;
	}

	logger_->info("AuthFlowStarted", {{"attempt", std::to_string(attempt)}});
	return url;
}

void AuthFlow::exchangeCodeForTokens(const std::string &code)
{
	const std::optional<ClientCredentials> credentials = store_->loadCredentials();
	if (!credentials.has_value()) {
		throw AuthError(AuthErrorKind::NotConfigured, "Client credentials are not set");
	}

	const std::optional<FlowState> flowState = flowState_->current();
	if (!flowState.has_value()) {
		throw AuthError(AuthErrorKind::AuthorizationFailed, "No flow state");
	}

	const std::string attempt = std::to_string(flowState->attempt);
	logger_->info("TokenExchanging", {{"attempt", attempt}});

	const TokenEndpointResponse response = tokenEndpoint_->post({
		{"client_id", credentials->client_id},
		{"client_secret", credentials->client_secret},
		{"code", code},
		{"code_verifier", flowState->code_verifier},
		{"grant_type", "authorization_code"},
		{"redirect_uri", config_.redirectUri},
	});

	if (!response.isSuccess()) {
		logger_->error("TokenExchangeRejected", {{"attempt", attempt}, {"status", std::to_string(response.status)}});
		throw AuthError(AuthErrorKind::TokenExchangeFailed, response.body);
	}

	const TokenResponse tokens = parseTokenResponse(response.body);
	store_->saveTokenSet(tokens.access_token, tokens.refresh_token, tokens.expires_in);
	flowState_->clearIfVerifier(flowState->code_verifier);

	logger_->info("TokenExchanged", {{"attempt", attempt}});
}

CallbackOutcome AuthFlow::handleCallback(const CallbackParams &params) noexcept
{
	if (params.error.has_value()) {
		logger_->warn("AuthorizationDenied", {{"error", *params.error}});
		std::string message = *params.error;
		if (params.errorDescription.has_value() && !params.errorDescription->empty()) {
			message += ": " + *params.errorDescription;
		}
		return {CallbackResult::ProviderError, std::move(message)};
	}

	if (!params.code.has_value() || params.code->empty()) {
		logger_->warn("CallbackMissingCode");
		return {CallbackResult::MissingCode, "Missing authorization code"};
	}

	const std::string receivedState = params.state.value_or("");
	if (!flowState_->matchesState(receivedState)) {
		const std::optional<FlowState> active = flowState_->current();
		logger_->warn("CallbackStateMismatch",
			      {{"attempt", active ? std::to_string(active->attempt) : std::string("none")},
			       {"received_state", receivedState},
			       {"expected_state", active ? active->state : std::string()}});
		return {CallbackResult::StateMismatch, "State mismatch, possible CSRF attack"};
	}

	try {
		exchangeCodeForTokens(*params.code);
	} catch (const AuthError &e) {
		logger_->error("CallbackExchangeFailed", {{"exception", e.what()}});
		return {CallbackResult::ExchangeFailed, e.what()};
	} catch (const std::exception &e) {
		logger_->error("CallbackExchangeFailed", {{"exception", e.what()}});
		return {CallbackResult::ExchangeFailed, e.what()};
	}

	return {CallbackResult::Authorized, "Authentication successful"};
}

void AuthFlow::cancelFlow() noexcept
{
	std::scoped_lock lock(startMutex_);
	listener_->stop();
	flowState_->clear();
	logger_->info("AuthFlowCancelled", {{"attempt", std::to_string(lastAttempt_)}});
}

} // namespace DriveLink::OAuth2
