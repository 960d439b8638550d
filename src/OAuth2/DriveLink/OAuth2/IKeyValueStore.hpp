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

#include <optional>
#include <string>

namespace DriveLink::OAuth2 {

/**
 * @brief Durable string storage behind CredentialStore.
 *
 * Implementations report I/O failures by throwing; CredentialStore translates them
 * into StorageFailed.
 */
class IKeyValueStore {
public:
	IKeyValueStore() noexcept = default;
	virtual ~IKeyValueStore() = default;

	IKeyValueStore(const IKeyValueStore &) = delete;
	IKeyValueStore &operator=(const IKeyValueStore &) = delete;
	IKeyValueStore(IKeyValueStore &&) = delete;
	IKeyValueStore &operator=(IKeyValueStore &&) = delete;

	[[nodiscard]]
	virtual std::optional<std::string> get(const std::string &key) const = 0;

	virtual void set(const std::string &key, const std::string &value) = 0;

	virtual void remove(const std::string &key) = 0;
};

} // namespace DriveLink::OAuth2
