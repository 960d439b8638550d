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

#include <algorithm>
#include <atomic>
#include <chrono>
#include <deque>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <random>
#include <stdexcept>
#include <string>
#include <vector>

#include <curl/curl.h>

#include <DriveLink/CurlHelper/CurlHandle.hpp>
#include <DriveLink/OAuth2/AuthError.hpp>
#include <DriveLink/OAuth2/Clock.hpp>
#include <DriveLink/OAuth2/ICallbackListener.hpp>
#include <DriveLink/OAuth2/IKeyValueStore.hpp>
#include <DriveLink/OAuth2/ITokenEndpointClient.hpp>
#include <DriveLink/OAuth2/MemoryKeyValueStore.hpp>

namespace DriveLink::OAuth2::Testing {

/// Clock whose time only moves when a test says so.
class ManualClock {
public:
	explicit ManualClock(Timestamp start) : now_(start) {}

	void set(Timestamp now) { now_ = now; }
	void advance(std::chrono::seconds delta) { now_ += delta.count(); }

	[[nodiscard]]
	Clock clock() const
	{
		return [this] { return std::chrono::system_clock::time_point(std::chrono::seconds(now_.load())); };
	}

private:
	std::atomic<Timestamp> now_;
};

/// Replays queued responses and records every form it was asked to post.
class FakeTokenEndpointClient final : public ITokenEndpointClient {
public:
	void enqueue(long status, std::string body)
	{
		std::scoped_lock lock(mutex_);
		responses_.push_back(TokenEndpointResponse{status, std::move(body)});
	}

	void failNextWithTransportError(std::string error)
	{
		std::scoped_lock lock(mutex_);
		transportError_ = std::move(error);
	}

	TokenEndpointResponse post(const FormFields &form) override
	{
		std::scoped_lock lock(mutex_);
		requests_.push_back(form);

		if (!transportError_.empty()) {
			std::string error = std::move(transportError_);
			transportError_.clear();
			throw AuthError(AuthErrorKind::HttpRequestFailed, error);
		}

		if (responses_.empty()) {
			throw std::logic_error("UnexpectedTokenRequest(FakeTokenEndpointClient)");
		}
		TokenEndpointResponse response = std::move(responses_.front());
		responses_.pop_front();
		return response;
	}

	[[nodiscard]]
	std::vector<FormFields> requests() const
	{
		std::scoped_lock lock(mutex_);
		return requests_;
	}

	[[nodiscard]]
	std::size_t requestCount() const
	{
		std::scoped_lock lock(mutex_);
		return requests_.size();
	}

private:
	mutable std::mutex mutex_;
	std::deque<TokenEndpointResponse> responses_;
	std::vector<FormFields> requests_;
	std::string transportError_;
};

[[nodiscard]]
inline std::string formValue(const FormFields &form, const std::string &name)
{
	for (const auto &[key, value] : form) {
		if (key == name) {
			return value;
		}
	}
	return {};
}

/// Captures the handler instead of opening a socket; tests play the browser.
class FakeCallbackListener final : public ICallbackListener {
public:
	void start(CallbackHandler handler) override
	{
		if (failStart) {
			throw AuthError(AuthErrorKind::CallbackServerFailed, "Address already in use");
		}
		handler_ = std::move(handler);
		running_ = true;
		startCount++;
	}

	void stop() noexcept override
	{
		if (running_) {
			stopCount++;
		}
		running_ = false;
	}

	[[nodiscard]]
	bool isRunning() const noexcept override
	{
		return running_;
	}

	/// Delivers a redirect the way the loopback listener would, then ends the run.
	CallbackOutcome deliver(const CallbackParams &params)
	{
		if (!handler_) {
			throw std::logic_error("NotStarted(FakeCallbackListener)");
		}
		CallbackHandler handler = handler_;
		running_ = false;
		return handler(params);
	}

	bool failStart = false;
	int startCount = 0;
	int stopCount = 0;

private:
	CallbackHandler handler_;
	bool running_ = false;
};

/// Counts writes so tests can assert that nothing was persisted.
class RecordingKeyValueStore final : public IKeyValueStore {
public:
	std::optional<std::string> get(const std::string &key) const override { return inner_.get(key); }

	void set(const std::string &key, const std::string &value) override
	{
		if (failWrites) {
			throw std::runtime_error("DiskFull(RecordingKeyValueStore)");
		}
		writeCount++;
		inner_.set(key, value);
	}

	void remove(const std::string &key) override
	{
		writeCount++;
		inner_.remove(key);
	}

	bool failWrites = false;
	int writeCount = 0;

private:
	MemoryKeyValueStore inner_;
};

struct TemporaryDirectory {
	std::filesystem::path path;

	TemporaryDirectory()
	{
		std::random_device rd;
		std::mt19937 gen(rd());
		std::uniform_int_distribution<> dist(0, 999999);
		path = std::filesystem::temp_directory_path() / ("drivelink-test-" + std::to_string(dist(gen)));
		std::filesystem::create_directories(path);
	}

	TemporaryDirectory(const TemporaryDirectory &) = delete;
	TemporaryDirectory &operator=(const TemporaryDirectory &) = delete;

	~TemporaryDirectory()
	{
		std::error_code ec;
		std::filesystem::remove_all(path, ec);
	}
};

/// Percent-decoded query parameters of `url` in order of appearance.
[[nodiscard]]
inline FormFields parseQuery(const std::string &url)
{
	FormFields fields;
	const auto questionMark = url.find('?');
	if (questionMark == std::string::npos) {
		return fields;
	}

	CurlHelper::CurlHandle curl;
	const auto unescape = [&curl](const std::string &s) {
		int length = 0;
		const std::unique_ptr<char, decltype(&curl_free)> decoded(
			curl_easy_unescape(curl.get(), s.c_str(), static_cast<int>(s.size()), &length), &curl_free);
		if (!decoded) {
			throw std::runtime_error("UnescapeError(parseQuery)");
		}
		return std::string(decoded.get(), static_cast<std::size_t>(length));
	};

	std::size_t pos = questionMark + 1;
	while (pos <= url.size()) {
		const auto amp = std::min(url.find('&', pos), url.size());
		const std::string pair = url.substr(pos, amp - pos);
		if (!pair.empty()) {
			const auto eq = pair.find('=');
			if (eq == std::string::npos) {
				fields.emplace_back(unescape(pair), std::string());
			} else {
				fields.emplace_back(unescape(pair.substr(0, eq)), unescape(pair.substr(eq + 1)));
			}
		}
		pos = amp + 1;
	}
	return fields;
}

} // namespace DriveLink::OAuth2::Testing
