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

#include "FlowStateHolder.hpp"

#include <openssl/crypto.h>

namespace DriveLink::OAuth2 {

namespace {

bool constantTimeEquals(std::string_view a, std::string_view b) noexcept
{
	if (a.size() != b.size()) {
		return false;
	}
	return CRYPTO_memcmp(a.data(), b.data(), a.size()) == 0;
}

} // anonymous namespace

void FlowStateHolder::replace(FlowState flowState)
{
	std::scoped_lock lock(mutex_);
	flowState_ = std::move(flowState);
}

std::optional<FlowState> FlowStateHolder::current() const
{
	std::scoped_lock lock(mutex_);
	return flowState_;
}

bool FlowStateHolder::matchesState(std::string_view state) const
{
	std::scoped_lock lock(mutex_);
	if (!flowState_.has_value() || flowState_->state.empty()) {
		return false;
	}
	return constantTimeEquals(flowState_->state, state);
}

bool FlowStateHolder::clearIfVerifier(std::string_view codeVerifier)
{
	std::scoped_lock lock(mutex_);
	if (!flowState_.has_value() || flowState_->code_verifier != codeVerifier) {
		return false;
	}
	flowState_.reset();
	return true;
}

void FlowStateHolder::clear() noexcept
{
	std::scoped_lock lock(mutex_);
	flowState_.reset();
}

} // namespace DriveLink::OAuth2
