/*
 * SPDX-FileCopyrightText: Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 * SPDX-License-Identifier: MIT
 *
 * DriveLink Logger Library
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

#include <algorithm>
#include <memory>
#include <mutex>
#include <source_location>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <DriveLink/Logger/ILogger.hpp>

namespace DriveLink::Logger::Testing {

/// One event as a sink received it, with owned copies of the fields.
struct RecordedEvent {
	std::string name;
	std::vector<std::pair<std::string, std::string>> fields;

	[[nodiscard]]
	std::string field(std::string_view key) const
	{
		const auto it = std::find_if(fields.begin(), fields.end(),
					     [key](const auto &field) { return field.first == key; });
		return it != fields.end() ? it->second : std::string();
	}
};

/// Keeps every event in memory so tests can assert on what was logged.
class RecordingLogger final : public ILogger {
public:
	[[nodiscard]]
	std::vector<RecordedEvent> events() const
	{
		std::scoped_lock lock(mutex_);
		return events_;
	}

	[[nodiscard]]
	std::vector<RecordedEvent> eventsNamed(std::string_view name) const
	{
		std::vector<RecordedEvent> matched;
		for (const RecordedEvent &event : events()) {
			if (event.name == name) {
				matched.push_back(event);
			}
		}
		return matched;
	}

	/// True when any field of any event carries `value`.
	[[nodiscard]]
	bool loggedValue(std::string_view value) const
	{
		for (const RecordedEvent &event : events()) {
			for (const auto &field : event.fields) {
				if (field.second.find(value) != std::string::npos) {
					return true;
				}
			}
		}
		return false;
	}

protected:
	void log(LogLevel, std::string_view name, std::source_location,
		 std::span<const LogField> context) const noexcept override
	{
		RecordedEvent event{std::string(name), {}};
		for (const LogField &field : context) {
			event.fields.emplace_back(std::string(field.key), std::string(field.value));
		}
		std::scoped_lock lock(mutex_);
		events_.push_back(std::move(event));
	}

private:
	mutable std::mutex mutex_;
	mutable std::vector<RecordedEvent> events_;
};

} // namespace DriveLink::Logger::Testing
