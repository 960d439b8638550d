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

#include <array>
#include <cstddef>
#include <initializer_list>
#include <source_location>
#include <span>
#include <string_view>

namespace DriveLink::Logger {

struct LogField {
	std::string_view key;
	std::string_view value;
};

inline constexpr std::string_view kRedactedValue = "[REDACTED]";

/**
 * True for keys whose values are credentials or one-time secrets of an authorization
 * attempt: `code`, `authorization` and any key ending in `_token`, `_secret`,
 * `_verifier` or `_state`.
 */
[[nodiscard]]
constexpr bool isSecretKey(std::string_view key) noexcept
{
	return key == "code" || key == "authorization" || key.ends_with("_token") || key.ends_with("_secret") ||
	       key.ends_with("_verifier") || key.ends_with("_state");
}

/**
 * @brief Structured event logger.
 *
 * Events are a name plus key/value fields. Values of secret keys are replaced with
 * kRedactedValue before any sink sees them, so no sink can leak a token by accident.
 * At most kMaxFields fields are forwarded per event.
 */
class ILogger {
public:
	static constexpr std::size_t kMaxFields = 16;

	ILogger() noexcept = default;
	virtual ~ILogger() = default;

	ILogger(const ILogger &) = delete;
	ILogger &operator=(const ILogger &) = delete;
	ILogger(ILogger &&) = delete;
	ILogger &operator=(ILogger &&) = delete;

	void debug(std::string_view name, std::initializer_list<LogField> context = {},
		   std::source_location loc = std::source_location::current()) const noexcept
	{
		dispatch(LogLevel::Debug, name, loc, context);
	}

	void info(std::string_view name, std::initializer_list<LogField> context = {},
		  std::source_location loc = std::source_location::current()) const noexcept
	{
		dispatch(LogLevel::Info, name, loc, context);
	}

	void warn(std::string_view name, std::initializer_list<LogField> context = {},
		  std::source_location loc = std::source_location::current()) const noexcept
	{
		dispatch(LogLevel::Warn, name, loc, context);
	}

	void error(std::string_view name, std::initializer_list<LogField> context = {},
		   std::source_location loc = std::source_location::current()) const noexcept
	{
		dispatch(LogLevel::Error, name, loc, context);
	}

protected:
	enum class LogLevel { Debug, Info, Warn, Error };

	virtual void log(LogLevel level, std::string_view name, std::source_location loc,
			 std::span<const LogField> context) const noexcept = 0;

private:
	void dispatch(LogLevel level, std::string_view name, std::source_location loc,
		      std::initializer_list<LogField> context) const noexcept
	{
		std::array<LogField, kMaxFields> fields{};
		std::size_t count = 0;
		for (const LogField &field : context) {
			if (count == fields.size()) {
				break;
			}
			fields[count++] = {field.key, isSecretKey(field.key) ? kRedactedValue : field.value};
		}
		log(level, name, loc, std::span<const LogField>(fields.data(), count));
	}
};

} // namespace DriveLink::Logger
