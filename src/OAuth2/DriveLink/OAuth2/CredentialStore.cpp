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

#include "CredentialStore.hpp"

#include <stdexcept>

#include <nlohmann/json.hpp>

#include "AuthError.hpp"
#include "TokenResponse.hpp"

namespace DriveLink::OAuth2 {

namespace {

constexpr const char *kCredentialsField = "client_credentials";
constexpr const char *kTokenSetField = "token_set";

std::optional<ClientCredentials> credentialsOf(const nlohmann::json &record)
{
	if (auto it = record.find(kCredentialsField); it != record.end() && !it->is_null()) {
		return it->get<ClientCredentials>();
	}
	return std::nullopt;
}

std::optional<TokenSet> tokenSetOf(const nlohmann::json &record)
{
	if (auto it = record.find(kTokenSetField); it != record.end() && !it->is_null()) {
		return it->get<TokenSet>();
	}
	return std::nullopt;
}

} // anonymous namespace

CredentialStore::CredentialStore(std::shared_ptr<IKeyValueStore> backend, std::shared_ptr<const Logger::ILogger> logger,
				 Clock clock)
	: backend_(backend ? std::move(backend) : throw std::invalid_argument("BackendIsNullError(CredentialStore)")),
	  logger_(logger ? std::move(logger) : throw std::invalid_argument("LoggerIsNullError(CredentialStore)")),
	  clock_(clock ? std::move(clock) : throw std::invalid_argument("ClockIsNullError(CredentialStore)"))
{
}

std::optional<ClientCredentials> CredentialStore::loadCredentials() const
{
	std::scoped_lock lock(mutex_);
	const nlohmann::json record = readRecord();
	try {
		return credentialsOf(record);
	} catch (const nlohmann::json::exception &e) {
		logger_->error("CredentialStoreRecordCorrupted", {{"field", kCredentialsField}, {"exception", e.what()}});
		throw AuthError(AuthErrorKind::StorageFailed, e.what());
	}
}

void CredentialStore::saveCredentials(const ClientCredentials &credentials)
{
	if (credentials.client_id.empty()) {
		throw std::invalid_argument("ClientIdIsEmptyError(CredentialStore::saveCredentials)");
	}

	std::scoped_lock lock(mutex_);
	nlohmann::json record = readRecord();
	record[kCredentialsField] = credentials;
	writeRecord(record);
	logger_->info("ClientCredentialsSaved");
}

void CredentialStore::forgetCredentials()
{
	std::scoped_lock lock(mutex_);
	try {
		backend_->remove(kRecordKey);
	} catch (const std::exception &e) {
		logger_->error("CredentialStoreRemoveError", {{"exception", e.what()}});
		throw AuthError(AuthErrorKind::StorageFailed, e.what());
	}
	logger_->info("ClientCredentialsForgotten");
}

std::optional<TokenSet> CredentialStore::loadTokenSet() const
{
	std::scoped_lock lock(mutex_);
	const nlohmann::json record = readRecord();
	try {
		return tokenSetOf(record);
	} catch (const nlohmann::json::exception &e) {
		logger_->error("CredentialStoreRecordCorrupted", {{"field", kTokenSetField}, {"exception", e.what()}});
		throw AuthError(AuthErrorKind::StorageFailed, e.what());
	}
}

void CredentialStore::saveTokenSet(const std::string &accessToken, const std::optional<std::string> &refreshToken,
				   std::optional<std::int64_t> expiresInSeconds)
{
	if (expiresInSeconds.has_value() && (*expiresInSeconds < 0 || *expiresInSeconds > kMaxExpiresInSeconds)) {
		throw std::invalid_argument("ExpiresInOutOfRangeError(CredentialStore)");
	}

	std::scoped_lock lock(mutex_);
	nlohmann::json record = readRecord();

	if (!record.contains(kCredentialsField) || record[kCredentialsField].is_null()) {
		throw AuthError(AuthErrorKind::NotConfigured, "Cannot store tokens without client credentials");
	}

	TokenSet tokenSet;
	try {
		tokenSet = tokenSetOf(record).value_or(TokenSet{});
	} catch (const nlohmann::json::exception &e) {
		logger_->warn("CredentialStoreTokenSetDiscarded", {{"exception", e.what()}});
		tokenSet = TokenSet{};
	}

	tokenSet.access_token = accessToken;

	if (refreshToken.has_value() && !refreshToken->empty()) {
		tokenSet.refresh_token = *refreshToken;
	}

	if (expiresInSeconds.has_value()) {
		tokenSet.expires_at = toTimestamp(clock_()) + *expiresInSeconds;
	} else {
		tokenSet.expires_at = std::nullopt;
	}

	record[kTokenSetField] = tokenSet;
	writeRecord(record);

	const std::string expiresAt = tokenSet.expires_at ? std::to_string(*tokenSet.expires_at) : "none";
	logger_->info("TokenSetSaved", {{"expires_at", expiresAt},
					{"has_refresh_token", tokenSet.hasRefreshToken() ? "true" : "false"}});
}

void CredentialStore::clearTokens()
{
	std::scoped_lock lock(mutex_);
	nlohmann::json record = readRecord();
	if (record.erase(kTokenSetField) > 0) {
		writeRecord(record);
	}
	logger_->info("TokenSetCleared");
}

AuthStatus CredentialStore::loadAuthStatus() const
{
	std::scoped_lock lock(mutex_);
	const nlohmann::json record = readRecord();

	AuthStatus status;
	try {
		status.configured = credentialsOf(record).has_value();
		const std::optional<TokenSet> tokenSet = tokenSetOf(record);
		status.authenticated = tokenSet.has_value() && tokenSet->hasAccessToken();
	} catch (const nlohmann::json::exception &e) {
		logger_->error("CredentialStoreRecordCorrupted", {{"exception", e.what()}});
		throw AuthError(AuthErrorKind::StorageFailed, e.what());
	}
	return status;
}

nlohmann::json CredentialStore::readRecord() const
{
	std::optional<std::string> raw;
	try {
		raw = backend_->get(kRecordKey);
	} catch (const std::exception &e) {
		logger_->error("CredentialStoreReadError", {{"exception", e.what()}});
		throw AuthError(AuthErrorKind::StorageFailed, e.what());
	}

	if (!raw.has_value()) {
		return nlohmann::json::object();
	}

	nlohmann::json record = nlohmann::json::parse(*raw, nullptr, false);
	if (record.is_discarded() || !record.is_object()) {
		logger_->error("CredentialStoreRecordCorrupted");
		throw AuthError(AuthErrorKind::StorageFailed, "Stored record is not a JSON object");
	}
	return record;
}

void CredentialStore::writeRecord(const nlohmann::json &record)
{
	try {
		backend_->set(kRecordKey, record.dump());
	} catch (const std::exception &e) {
		logger_->error("CredentialStoreWriteError", {{"exception", e.what()}});
		throw AuthError(AuthErrorKind::StorageFailed, e.what());
	}
}

} // namespace DriveLink::OAuth2
