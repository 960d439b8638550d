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

#include <filesystem>
#include <mutex>

#include <nlohmann/json_fwd.hpp>

#include "IKeyValueStore.hpp"

namespace DriveLink::OAuth2 {

/**
 * @brief Keeps every entry in one JSON object on disk.
 *
 * Writes go to a sibling temporary file which then replaces the target, so a crash
 * never leaves a truncated file behind. Parent directories are created on the first
 * write and the file is restricted to the owner.
 */
class JsonFileKeyValueStore final : public IKeyValueStore {
public:
	explicit JsonFileKeyValueStore(std::filesystem::path path);
	~JsonFileKeyValueStore() noexcept override = default;

	std::optional<std::string> get(const std::string &key) const override;
	void set(const std::string &key, const std::string &value) override;
	void remove(const std::string &key) override;

	[[nodiscard]]
	const std::filesystem::path &path() const noexcept
	{
		return path_;
	}

private:
	nlohmann::json readAll() const;
	void writeAll(const nlohmann::json &j) const;

	const std::filesystem::path path_;
	mutable std::mutex mutex_;
};

} // namespace DriveLink::OAuth2
