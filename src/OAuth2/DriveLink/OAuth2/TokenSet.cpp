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

#include "TokenSet.hpp"

#include <limits>

#include <nlohmann/json.hpp>

namespace DriveLink::OAuth2 {

bool TokenSet::needsRefresh(std::chrono::system_clock::time_point now, std::chrono::seconds margin) const noexcept
{
	if (!expires_at.has_value()) {
		return false;
	}

	// expires_at - margin, saturated so that a corrupt stored value cannot overflow.
	const std::int64_t marginSeconds = margin.count();
	Timestamp threshold;
	if (marginSeconds > 0 && *expires_at < std::numeric_limits<Timestamp>::min() + marginSeconds) {
		threshold = std::numeric_limits<Timestamp>::min();
	} else if (marginSeconds < 0 && *expires_at > std::numeric_limits<Timestamp>::max() + marginSeconds) {
		threshold = std::numeric_limits<Timestamp>::max();
	} else {
		threshold = *expires_at - marginSeconds;
	}
	return toTimestamp(now) >= threshold;
}

void from_json(const nlohmann::json &j, TokenSet &p)
{
	j.at("access_token").get_to(p.access_token);

	if (auto it = j.find("refresh_token"); it != j.end() && !it->is_null()) {
		it->get_to(p.refresh_token.emplace());
	} else {
		p.refresh_token = std::nullopt;
	}

	if (auto it = j.find("expires_at"); it != j.end() && !it->is_null()) {
		// Anything but a signed-range integer is read as already expired, which forces a refresh.
		if (it->is_number_integer() && !it->is_number_unsigned()) {
			it->get_to(p.expires_at.emplace());
		} else if (it->is_number_unsigned() &&
			   it->get<std::uint64_t>() <= static_cast<std::uint64_t>(std::numeric_limits<Timestamp>::max())) {
			p.expires_at = static_cast<Timestamp>(it->get<std::uint64_t>());
		} else {
			p.expires_at = 0;
		}
	} else {
		p.expires_at = std::nullopt;
	}
}

void to_json(nlohmann::json &j, const TokenSet &p)
{
	j = nlohmann::json{{"access_token", p.access_token}};

	if (p.refresh_token.has_value())
		j["refresh_token"] = *p.refresh_token;

	if (p.expires_at.has_value())
		j["expires_at"] = *p.expires_at;
}

} // namespace DriveLink::OAuth2
