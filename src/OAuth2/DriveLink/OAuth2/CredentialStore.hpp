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
#include <optional>
#include <string>

#include <nlohmann/json_fwd.hpp>

#include <DriveLink/Logger/ILogger.hpp>

#include "AuthStatus.hpp"
#include "ClientCredentials.hpp"
#include "Clock.hpp"
#include "IKeyValueStore.hpp"
#include "TokenSet.hpp"

namespace DriveLink::OAuth2 {

/**
 * @brief The single persisted authorization record.
 *
 * Client credentials and the token set live in one JSON document under one key so
 * that every read observes a consistent pair. Each operation holds the store mutex
 * for its whole read-modify-write cycle.
 *
 * Every backend failure surfaces as AuthError StorageFailed.
 */
class CredentialStore {
public:
	static constexpr const char *kRecordKey = "oauth2";

	CredentialStore(std::shared_ptr<IKeyValueStore> backend, std::shared_ptr<const Logger::ILogger> logger,
			Clock clock = systemClock());
	~CredentialStore() noexcept = default;

	CredentialStore(const CredentialStore &) = delete;
	CredentialStore &operator=(const CredentialStore &) = delete;
	CredentialStore(CredentialStore &&) = delete;
	CredentialStore &operator=(CredentialStore &&) = delete;

	[[nodiscard]]
	std::optional<ClientCredentials> loadCredentials() const;

	/// Replaces the credentials and keeps any stored tokens.
	void saveCredentials(const ClientCredentials &credentials);

	/// Removes the whole record, tokens included.
	void forgetCredentials();

	/// Returns nullopt when no access token has ever been stored or after clearTokens().
	[[nodiscard]]
	std::optional<TokenSet> loadTokenSet() const;

	/**
	 * Stores a freshly issued access token.
	 *
	 * An absent or empty `refreshToken` keeps the stored refresh token. An absent
	 * `expiresInSeconds` leaves `expires_at` unset, otherwise it becomes now + expires_in.
	 *
	 * @throws std::invalid_argument when `expiresInSeconds` is outside [0, kMaxExpiresInSeconds].
	 * @throws AuthError NotConfigured when no credentials are stored.
	 */
	void saveTokenSet(const std::string &accessToken, const std::optional<std::string> &refreshToken,
			  std::optional<std::int64_t> expiresInSeconds);

	/// Drops the token set and keeps the credentials.
	void clearTokens();

	[[nodiscard]]
	AuthStatus loadAuthStatus() const;

private:
	nlohmann::json readRecord() const;
	void writeRecord(const nlohmann::json &record);

	const std::shared_ptr<IKeyValueStore> backend_;
	const std::shared_ptr<const Logger::ILogger> logger_;
	const Clock clock_;

	mutable std::mutex mutex_;
};

} // namespace DriveLink::OAuth2
