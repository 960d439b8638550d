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

#include "JsonFileKeyValueStore.hpp"

#include <fstream>
#include <stdexcept>

#include <nlohmann/json.hpp>

namespace DriveLink::OAuth2 {

JsonFileKeyValueStore::JsonFileKeyValueStore(std::filesystem::path path)
	: path_(path.empty() ? throw std::invalid_argument("PathIsEmptyError(JsonFileKeyValueStore)") : std::move(path))
{
}

std::optional<std::string> JsonFileKeyValueStore::get(const std::string &key) const
{
	std::scoped_lock lock(mutex_);
	const nlohmann::json j = readAll();
	if (auto it = j.find(key); it != j.end() && it->is_string()) {
		return it->get<std::string>();
	}
	return std::nullopt;
}

void JsonFileKeyValueStore::set(const std::string &key, const std::string &value)
{
	std::scoped_lock lock(mutex_);
	nlohmann::json j = readAll();
	j[key] = value;
	writeAll(j);
}

void JsonFileKeyValueStore::remove(const std::string &key)
{
	std::scoped_lock lock(mutex_);
	nlohmann::json j = readAll();
	if (j.erase(key) > 0) {
		writeAll(j);
	}
}

nlohmann::json JsonFileKeyValueStore::readAll() const
{
	std::error_code ec;
	if (!std::filesystem::exists(path_, ec)) {
		return nlohmann::json::object();
	}

	std::ifstream ifs(path_, std::ios::in | std::ios::binary);
	if (!ifs.is_open()) {
		throw std::runtime_error("FileOpenError(JsonFileKeyValueStore::readAll):" + path_.string());
	}

	nlohmann::json j = nlohmann::json::parse(ifs, nullptr, false);
	if (j.is_discarded() || !j.is_object()) {
		throw std::runtime_error("FileContentError(JsonFileKeyValueStore::readAll):" + path_.string());
	}
	return j;
}

void JsonFileKeyValueStore::writeAll(const nlohmann::json &j) const
{
	if (path_.has_parent_path()) {
		std::filesystem::create_directories(path_.parent_path());
	}

	std::filesystem::path tmpPath = path_;
	tmpPath += ".tmp";

	// Restricted to the owner while still empty, before any secret is written.
	std::filesystem::remove(tmpPath);
	{
		std::ofstream create(tmpPath, std::ios::out | std::ios::trunc | std::ios::binary);
		if (!create.is_open()) {
			throw std::runtime_error("FileOpenError(JsonFileKeyValueStore::writeAll):" + tmpPath.string());
		}
	}
	std::filesystem::permissions(tmpPath, std::filesystem::perms::owner_read | std::filesystem::perms::owner_write,
				     std::filesystem::perm_options::replace);

	{
		std::ofstream ofs(tmpPath, std::ios::out | std::ios::trunc | std::ios::binary);
		if (!ofs.is_open()) {
			throw std::runtime_error("FileOpenError(JsonFileKeyValueStore::writeAll):" + tmpPath.string());
		}
		ofs << j.dump();
		ofs.flush();
		if (!ofs) {
			throw std::runtime_error("FileWriteError(JsonFileKeyValueStore::writeAll):" + tmpPath.string());
		}
	}

	std::filesystem::rename(tmpPath, path_);
}

} // namespace DriveLink::OAuth2
