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

#include <iostream>
#include <memory>
#include <mutex>
#include <source_location>
#include <span>
#include <string_view>

#include "ILogger.hpp"

namespace DriveLink::Logger {

/**
 * @brief Writes one logfmt-style line per event to stderr so that command output on stdout stays clean.
 *
 * Lines look like `level=INFO\tname=TokenExchanged\tlocation=AuthFlow.cpp:120\tkey=value`.
 * Values containing whitespace or quotes are written double-quoted with C escapes.
 * Writes are serialized so that events from the callback listener thread and the
 * caller thread never interleave within a line.
 */
class PrintLogger : public ILogger {
public:
	PrintLogger() = default;
	~PrintLogger() override = default;

	static std::shared_ptr<PrintLogger> instance()
	{
		static std::shared_ptr<PrintLogger> instance = std::make_shared<PrintLogger>();
		return instance;
	}

protected:
	void log(LogLevel level, std::string_view name, std::source_location loc,
		 std::span<const LogField> context) const noexcept override
	{
		std::scoped_lock lock(mutex_);

		switch (level) {
		case LogLevel::Debug:
			std::clog << "level=DEBUG";
			break;
		case LogLevel::Info:
			std::clog << "level=INFO";
			break;
		case LogLevel::Warn:
			std::clog << "level=WARN";
			break;
		case LogLevel::Error:
			std::clog << "level=ERROR";
			break;
		default:
			std::clog << "level=UNKNOWN";
			break;
		}

		std::clog << "\tname=" << name << "\tlocation=" << loc.file_name() << ":" << loc.line();
		for (const auto &field : context) {
			std::clog << "\t" << field.key << "=";
			writeValue(field.value);
		}
		std::clog << std::endl;
	}

private:
	/// Values that come from the network may carry tabs or newlines; quote them so one event stays one line.
	static void writeValue(std::string_view value) noexcept
	{
		if (value.find_first_of(" \t\r\n\"") == std::string_view::npos) {
			std::clog << value;
			return;
		}

		std::clog << '"';
		for (const char c : value) {
			switch (c) {
			case '"':
				std::clog << "\\\"";
				break;
			case '\\':
				std::clog << "\\\\";
				break;
			case '\t':
				std::clog << "\\t";
				break;
			case '\r':
				std::clog << "\\r";
				break;
			case '\n':
				std::clog << "\\n";
				break;
			default:
				std::clog << c;
				break;
			}
		}
		std::clog << '"';
	}

	mutable std::mutex mutex_;
};

} // namespace DriveLink::Logger
