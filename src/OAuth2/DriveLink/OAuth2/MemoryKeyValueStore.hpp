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

#include <map>
#include <mutex>

#include "IKeyValueStore.hpp"

namespace DriveLink::OAuth2 {

class MemoryKeyValueStore final : public IKeyValueStore {
public:
	MemoryKeyValueStore() = default;
	~MemoryKeyValueStore() noexcept override = default;

	std::optional<std::string> get(const std::string &key) const override
	{
		std::scoped_lock lock(mutex_);
		if (auto it = entries_.find(key); it != entries_.end()) {
			return it->second;
		}
		return std::nullopt;
	}

	void set(const std::string &key, const std::string &value) override
	{
		std::scoped_lock lock(mutex_);
		entries_[key] = value;
	}

	void remove(const std::string &key) override
	{
		std::scoped_lock lock(mutex_);
		entries_.erase(key);
	}

private:
	mutable std::mutex mutex_;
	std::map<std::string, std::string> entries_;
};

} // namespace DriveLink::OAuth2
