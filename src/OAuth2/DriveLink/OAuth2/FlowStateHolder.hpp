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
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace DriveLink::OAuth2 {

struct FlowState {
	std::string code_verifier;
	std::string state;
	/// Sequence number of the attempt, carried in log events to correlate them.
	std::uint64_t attempt = 0;
};

/**
 * @brief Single slot holding the one active authorization attempt.
 *
 * Shared by the thread that starts flows and the listener thread that verifies
 * callbacks. Replacing the slot silently invalidates the previous attempt.
 */
class FlowStateHolder {
public:
	FlowStateHolder() = default;
	~FlowStateHolder() noexcept = default;

	FlowStateHolder(const FlowStateHolder &) = delete;
	FlowStateHolder &operator=(const FlowStateHolder &) = delete;
	FlowStateHolder(FlowStateHolder &&) = delete;
	FlowStateHolder &operator=(FlowStateHolder &&) = delete;

	void replace(FlowState flowState);

	[[nodiscard]]
	std::optional<FlowState> current() const;

	/// Exact comparison against the live state. False when no flow is active.
	[[nodiscard]]
	bool matchesState(std::string_view state) const;

	/**
	 * Clears the slot only if it still holds the attempt identified by `codeVerifier`,
	 * so finishing an old exchange never discards a flow started meanwhile.
	 */
	bool clearIfVerifier(std::string_view codeVerifier);

	void clear() noexcept;

private:
	mutable std::mutex mutex_;
	std::optional<FlowState> flowState_;
};

} // namespace DriveLink::OAuth2
