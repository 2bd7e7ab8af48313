// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#pragma once

#include <bitset>
#include <string>
#include <string_view>
#include <vector>

/**
 * A set of characters which need to be escaped, specified at
 * runtime.  Instances can be passed as predicate to EscapeIf() and
 * UnescapeIf().
 */
class EscapeCharSet {
	std::bitset<0x80> ascii;

	/**
	 * Non-ASCII members, sorted.
	 */
	std::vector<char32_t> other;

	/**
	 * The UTF-8 string this set was constructed from.
	 */
	std::string chars;

public:
	/**
	 * Throws std::invalid_argument if the string is empty, is not
	 * valid UTF-8 or contains the escape marker (which cannot be
	 * escaped by this scheme).
	 *
	 * @param _chars a UTF-8 string listing all members
	 */
	explicit EscapeCharSet(std::string_view _chars);

	[[gnu::pure]]
	bool operator()(char32_t ch) const noexcept {
		if (ch < 0x80)
			return ascii[ch];

		return Contains(ch);
	}

	const std::string &ToString() const noexcept {
		return chars;
	}

private:
	[[gnu::pure]]
	bool Contains(char32_t ch) const noexcept;
};
